#include "ytree/loader.h"
#include "ytree/exceptions.h"
#include <sstream>
#include <utility>

namespace YTree
{
	Loader::Loader(std::istream& in, const LoadOptions& options)
		: m_parser(in, options.parser), m_options(options), m_failed(false)
	{
	}

	Loader::~Loader()
	{
	}

	Loader::operator bool() const
	{
		return !m_failed && m_parser;
	}

	bool Loader::GetNextDocument(Document& document)
	{
		if(m_failed)
			return false;

		Document next;
		Composer composer(next, m_options.composer);
		try {
			if(!m_parser.HandleNextDocument(composer))
				return false;
		} catch(const Exception&) {
			if(m_options.parser.strict)
				m_failed = true;
			throw;
		}

		document = std::move(next);
		return true;
	}

	std::vector<Document> LoadAll(std::istream& in, const LoadOptions& options)
	{
		std::vector<Document> documents;
		Loader loader(in, options);
		Document document;
		while(loader.GetNextDocument(document))
			documents.push_back(std::move(document));
		return documents;
	}

	std::vector<Document> LoadAll(const std::string& input, const LoadOptions& options)
	{
		std::stringstream stream(input);
		return LoadAll(stream, options);
	}

	Document Load(std::istream& in, const LoadOptions& options)
	{
		Document document;
		Loader loader(in, options);
		if(!loader.GetNextDocument(document))
			return Document();
		return document;
	}

	Document Load(const std::string& input, const LoadOptions& options)
	{
		std::stringstream stream(input);
		return Load(stream, options);
	}
}
