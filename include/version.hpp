#ifndef GITFLEET_VERSION_HPP
#define GITFLEET_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define GITFLEET_VERSION_MAJOR 0
#define GITFLEET_VERSION_MINOR 3
#define GITFLEET_VERSION_PATCH 0

/*
 * Release tag injected by the packaging workflow.
 * Example format: "0.3.0" or "2025.07.31-1".
 */
#define GITFLEET_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* GITFLEET_VERSION = GITFLEET_VERSION_STR;

#endif /* GITFLEET_VERSION_HPP */
