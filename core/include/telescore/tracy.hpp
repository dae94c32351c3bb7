#pragma once

#ifdef TELESCORE_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define TELESCORE_ZONE ZoneScoped
#  define TELESCORE_ZONE_N(name) ZoneScopedN(name)
#else
#  define TELESCORE_ZONE
#  define TELESCORE_ZONE_N(name)
#endif
