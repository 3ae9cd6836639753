#pragma once
#include <string>

namespace vigil::model {

struct PackageItem {
  std::string name;
  std::string version;
};

} // namespace vigil::model
