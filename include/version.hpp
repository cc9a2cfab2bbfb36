#ifndef RALPHTOWN_VERSION_HPP
#define RALPHTOWN_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define RALPHTOWN_VERSION_MAJOR 0
#define RALPHTOWN_VERSION_MINOR 3
#define RALPHTOWN_VERSION_PATCH 0

/*
 * Release tag injected by the packaging step.
 * Example format: "0.3.0" or "0.3.0-dev".
 */
#define RALPHTOWN_VERSION_STR "0.3.0-dev"
/* ------------------------------------------------------------------ */

constexpr const char* RALPHTOWN_VERSION = RALPHTOWN_VERSION_STR;

#endif /* RALPHTOWN_VERSION_HPP */
