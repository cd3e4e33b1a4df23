#pragma once

#define REPLACER_PRAGMA(x) _Pragma(#x)

#ifdef __GNUC__
#define REPLACER_GCC_DIAGNOSTIC(x) REPLACER_PRAGMA(GCC diagnostic x)
#else
#define REPLACER_GCC_DIAGNOSTIC(x) /**/
#endif

#ifdef _MSC_VER
#define REPLACER_MSC_WARNING(x) REPLACER_PRAGMA(warning(x))
#else
#define REPLACER_MSC_WARNING(x) /**/
#endif

#define REPLACER_WARNINGS_PUSH REPLACER_GCC_DIAGNOSTIC(push) REPLACER_MSC_WARNING(push)
#define REPLACER_WARNINGS_POP  REPLACER_GCC_DIAGNOSTIC(pop) REPLACER_MSC_WARNING(pop)
