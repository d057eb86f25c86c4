#ifndef GITSIGHT_VERSION_HPP
#define GITSIGHT_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GITSIGHT_VERSION_MAJOR 0
#define GITSIGHT_VERSION_MINOR 3
#define GITSIGHT_VERSION_PATCH 0

/* Keep in step with the numeric macros above. */
#define GITSIGHT_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITSIGHT_VERSION = GITSIGHT_VERSION_STR;

#endif /* GITSIGHT_VERSION_HPP */
