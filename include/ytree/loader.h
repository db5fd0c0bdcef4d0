#ifndef LOADER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define LOADER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/composer.h"
#include "ytree/document.h"
#include "ytree/noncopyable.h"
#include "ytree/parser.h"
#include <ios>
#include <string>
#include <vector>

namespace YTree
{
	struct YTREE_API LoadOptions {
		ParserOptions parser;
		ComposerOptions composer;
	};

	// Loader
	// . Composes the documents of a stream one at a time.
	class YTREE_API Loader: private noncopyable
	{
	public:
		explicit Loader(std::istream& in, const LoadOptions& options = LoadOptions());
		~Loader();

		operator bool() const;

		// GetNextDocument
		// . Returns false when there are no more documents.
		// . A failed document throws; with a non-strict parser the next call
		//   goes on with the following document.
		bool GetNextDocument(Document& document);

	private:
		Parser m_parser;
		LoadOptions m_options;
		bool m_failed;
	};

	YTREE_API std::vector<Document> LoadAll(std::istream& in, const LoadOptions& options = LoadOptions());
	YTREE_API std::vector<Document> LoadAll(const std::string& input, const LoadOptions& options = LoadOptions());

	// Load
	// . The first document of the stream (with no root if there is none).
	YTREE_API Document Load(std::istream& in, const LoadOptions& options = LoadOptions());
	YTREE_API Document Load(const std::string& input, const LoadOptions& options = LoadOptions());
}

#endif // LOADER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
