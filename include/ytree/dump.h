#ifndef DUMP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define DUMP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/document.h"
#include "ytree/emitteroptions.h"
#include "ytree/event.h"
#include <string>
#include <vector>

namespace YTree
{
	// Dump
	// . Writes documents as YAML text that loads back to equal documents.
	//   Shared nodes get anchors; names the documents declared are kept.
	// . Throws EmitError.
	YTREE_API std::string Dump(const std::vector<Document>& documents, const EmitterOptions& options = EmitterOptions());
	YTREE_API std::string Dump(const Document& document, const EmitterOptions& options = EmitterOptions());

	// EmitEvents
	// . Writes an event stream (e.g. from ParseEvents) back out as text.
	YTREE_API std::string EmitEvents(const std::vector<Event>& events, const EmitterOptions& options = EmitterOptions());
}

#endif // DUMP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
