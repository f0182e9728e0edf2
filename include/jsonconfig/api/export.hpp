#pragma once

#if defined(_WIN32)
#if defined(JSONCONFIG_BUILD_DLL)
#define JSONCONFIG_API __declspec(dllexport)
#elif defined(JSONCONFIG_USE_DLL)
#define JSONCONFIG_API __declspec(dllimport)
#else
#define JSONCONFIG_API
#endif
#else
#define JSONCONFIG_API
#endif
