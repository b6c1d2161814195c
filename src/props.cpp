#include "hal/props.hpp"

#include "hal/PropertyMap.hpp"

#include <string>

namespace hal::props {

void install_defaults(PropertyMap &propertyMap) {
  if(!propertyMap.query_prop(LOG_LEVEL).first) {
    propertyMap.get_prop<std::string>(LOG_LEVEL).set("info");
  }

  if(!propertyMap.query_prop(LOG_VERBOSE).first) {
    propertyMap.get_prop<bool>(LOG_VERBOSE).set(false);
  }

  if(!propertyMap.query_prop(VALIDATE_TYPES).first) {
    propertyMap.get_prop<bool>(VALIDATE_TYPES).set(true);
  }
}

}  // namespace hal::props
