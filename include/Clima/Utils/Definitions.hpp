#pragma once

#ifndef CLIMA_VERSION
  #define CLIMA_VERSION "0.1.0"
#endif

#ifndef CLIMA_USER_AGENT
  #define CLIMA_USER_AGENT "clima++/" CLIMA_VERSION
#endif

/// Macro alias for trailing return type functions.
#define fn auto
