#ifndef DLL_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define DLL_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

// The following ifdef block is the standard way of creating macros which make exporting
// from a DLL simpler. All files within this DLL are compiled with the ytree_EXPORTS
// symbol defined on the command line. this symbol should not be defined on any project
// that uses this DLL.
#undef YTREE_API

#ifdef YTREE_DLL // Using or Building ytree DLL (definition defined manually)
	#ifdef YTREE_EXPORTS // Building ytree DLL (definition created by CMake or defined manually)
		#if defined(_MSC_VER)
			#define YTREE_API __declspec(dllexport)
		#else
			#define YTREE_API __attribute__((visibility("default")))
		#endif
	#else
		#if defined(_MSC_VER)
			#define YTREE_API __declspec(dllimport)
		#else
			#define YTREE_API
		#endif
	#endif
#else // YTREE_DLL
#define YTREE_API
#endif // YTREE_DLL

#endif // DLL_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
