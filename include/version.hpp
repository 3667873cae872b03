#ifndef AUTODEPLOY_VERSION_HPP
#define AUTODEPLOY_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define AUTODEPLOY_VERSION_MAJOR 0
#define AUTODEPLOY_VERSION_MINOR 1
#define AUTODEPLOY_VERSION_PATCH 0

/*
 * Release tag, overridden by the build with -DAUTODEPLOY_VERSION_STR=...
 */
#ifndef AUTODEPLOY_VERSION_STR
#define AUTODEPLOY_VERSION_STR "0.1.0"
#endif
/* ------------------------------------------------------------------ */

constexpr const char* AUTODEPLOY_VERSION = AUTODEPLOY_VERSION_STR;

#endif /* AUTODEPLOY_VERSION_HPP */
