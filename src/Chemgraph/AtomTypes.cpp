/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/AtomTypes.h"

#include "Utils/Geometry/ElementInfo.h"

#include <stdexcept>

namespace Scine {
namespace Chemgraph {

static_assert(
  static_cast<std::underlying_type<AtomType>::type>(AtomType::Sibf) == nAtomTypes - 1,
  "Did you add an atom type and not alter nAtomTypes?"
);

namespace {

bool onlySingle(const BondCounts& counts) {
  return counts.doubles == 0 && counts.triple == 0 && counts.aromatic == 0;
}

AtomType carbonType(const BondCounts& counts) {
  if(onlySingle(counts)) {
    return AtomType::Cs;
  }

  if(counts.triple == 0 && counts.aromatic == 0) {
    if(counts.doubles == 1) {
      return (counts.doublesToOxygen == 1) ? AtomType::CO : AtomType::Cd;
    }

    if(counts.doubles == 2) {
      return AtomType::Cdd;
    }
  }

  if(counts.triple == 1 && counts.doubles == 0 && counts.aromatic == 0) {
    return AtomType::Ct;
  }

  if(counts.doubles == 0 && counts.triple == 0) {
    if(counts.aromatic == 1 || counts.aromatic == 2) {
      return AtomType::Cb;
    }

    if(counts.aromatic == 3) {
      return AtomType::Cbf;
    }
  }

  return AtomType::C;
}

AtomType oxygenType(const BondCounts& counts) {
  if(counts.total() == 0) {
    return AtomType::Oa;
  }

  if(onlySingle(counts)) {
    return AtomType::Os;
  }

  if(counts.doubles == 1 && counts.triple == 0 && counts.aromatic == 0 && counts.single == 0) {
    return AtomType::Od;
  }

  if(counts.triple == 1 && counts.doubles == 0 && counts.aromatic == 0 && counts.single == 0) {
    return AtomType::Ot;
  }

  return AtomType::O;
}

AtomType sulfurType(const BondCounts& counts) {
  if(onlySingle(counts)) {
    return AtomType::Ss;
  }

  if(counts.doubles == 1 && counts.triple == 0 && counts.aromatic == 0) {
    return AtomType::Sd;
  }

  return AtomType::S;
}

AtomType siliconType(const BondCounts& counts) {
  if(onlySingle(counts)) {
    return AtomType::Sis;
  }

  if(counts.triple == 0 && counts.aromatic == 0) {
    if(counts.doubles == 1) {
      return (counts.doublesToOxygen == 1) ? AtomType::SiO : AtomType::Sid;
    }

    if(counts.doubles == 2) {
      return AtomType::Sidd;
    }
  }

  if(counts.triple == 1 && counts.doubles == 0 && counts.aromatic == 0) {
    return AtomType::Sit;
  }

  if(counts.doubles == 0 && counts.triple == 0) {
    if(counts.aromatic == 1 || counts.aromatic == 2) {
      return AtomType::Sib;
    }

    if(counts.aromatic == 3) {
      return AtomType::Sibf;
    }
  }

  return AtomType::Si;
}

} // namespace

unsigned BondCounts::total() const {
  return single + doubles + triple + aromatic;
}

AtomType perceiveAtomType(const Utils::ElementType element, const BondCounts& counts) {
  switch(Utils::ElementInfo::element(Utils::ElementInfo::Z(element))) {
    case Utils::ElementType::H: return AtomType::H;
    case Utils::ElementType::C: return carbonType(counts);
    case Utils::ElementType::O: return oxygenType(counts);
    case Utils::ElementType::N: return AtomType::N;
    case Utils::ElementType::S: return sulfurType(counts);
    case Utils::ElementType::Si: return siliconType(counts);
    default: return AtomType::RnotH;
  }
}

AtomType parent(const AtomType type) {
  switch(type) {
    case AtomType::R:
    case AtomType::RnotH:
    case AtomType::H:
      return AtomType::R;
    case AtomType::C:
    case AtomType::O:
    case AtomType::N:
    case AtomType::S:
    case AtomType::Si:
      return AtomType::RnotH;
    case AtomType::Cs:
    case AtomType::Cd:
    case AtomType::Cdd:
    case AtomType::Ct:
    case AtomType::CO:
    case AtomType::Cb:
    case AtomType::Cbf:
      return AtomType::C;
    case AtomType::Os:
    case AtomType::Od:
    case AtomType::Oa:
    case AtomType::Ot:
      return AtomType::O;
    case AtomType::Ss:
    case AtomType::Sd:
      return AtomType::S;
    case AtomType::Sis:
    case AtomType::Sid:
    case AtomType::Sidd:
    case AtomType::Sit:
    case AtomType::SiO:
    case AtomType::Sib:
    case AtomType::Sibf:
      return AtomType::Si;
  }

  throw std::logic_error("Unhandled atom type");
}

bool isSpecificCaseOf(AtomType type, const AtomType other) {
  while(true) {
    if(type == other) {
      return true;
    }

    if(type == AtomType::R) {
      return false;
    }

    type = parent(type);
  }
}

bool isSpecificCaseOf(AtomType type, const AtomTypeSet& set) {
  while(true) {
    if(set.isSet(type)) {
      return true;
    }

    if(type == AtomType::R) {
      return false;
    }

    type = parent(type);
  }
}

std::string name(const AtomType type) {
  switch(type) {
    case AtomType::R: return "R";
    case AtomType::RnotH: return "R!H";
    case AtomType::C: return "C";
    case AtomType::Cs: return "Cs";
    case AtomType::Cd: return "Cd";
    case AtomType::Cdd: return "Cdd";
    case AtomType::Ct: return "Ct";
    case AtomType::CO: return "CO";
    case AtomType::Cb: return "Cb";
    case AtomType::Cbf: return "Cbf";
    case AtomType::H: return "H";
    case AtomType::O: return "O";
    case AtomType::Os: return "Os";
    case AtomType::Od: return "Od";
    case AtomType::Oa: return "Oa";
    case AtomType::Ot: return "Ot";
    case AtomType::N: return "N";
    case AtomType::S: return "S";
    case AtomType::Ss: return "Ss";
    case AtomType::Sd: return "Sd";
    case AtomType::Si: return "Si";
    case AtomType::Sis: return "Sis";
    case AtomType::Sid: return "Sid";
    case AtomType::Sidd: return "Sidd";
    case AtomType::Sit: return "Sit";
    case AtomType::SiO: return "SiO";
    case AtomType::Sib: return "Sib";
    case AtomType::Sibf: return "Sibf";
  }

  throw std::logic_error("Unhandled atom type");
}

} // namespace Chemgraph
} // namespace Scine
