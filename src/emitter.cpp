#include "ytree/emitter.h"
#include "emitterstate.h"
#include "emitterutils.h"
#include "indentation.h"
#include <fmt/format.h>
#include <map>

namespace YTree
{
	namespace
	{
		// longest simple key the scanner accepts
		const std::size_t MAX_SIMPLE_KEY_LENGTH = 1024;

		const char * const CORE_TAG_PREFIX = "tag:yaml.org,2002:";
	}

	Emitter::Emitter(): m_pState(new EmitterState), m_emptyScalar(false)
	{
	}

	Emitter::Emitter(std::ostream& stream): m_stream(stream), m_pState(new EmitterState), m_emptyScalar(false)
	{
	}

	Emitter::~Emitter()
	{
	}

	const char *Emitter::c_str() const
	{
		return m_stream.str();
	}

	std::size_t Emitter::size() const
	{
		return m_stream.pos();
	}

	// state checking
	bool Emitter::good() const
	{
		return m_pState->good();
	}

	const std::string Emitter::GetLastError() const
	{
		return m_pState->GetLastError();
	}

	EmitError::Kind Emitter::GetLastErrorKind() const
	{
		return m_pState->GetLastErrorKind();
	}

	// global setters
	bool Emitter::SetOutputCharset(EMITTER_MANIP value)
	{
		return m_pState->SetOutputCharset(value, FmtScope::Global);
	}

	bool Emitter::SetStringFormat(EMITTER_MANIP value)
	{
		return m_pState->SetStringFormat(value, FmtScope::Global);
	}

	bool Emitter::SetSeqFormat(EMITTER_MANIP value)
	{
		return m_pState->SetFlowType(GroupType::Seq, value, FmtScope::Global);
	}

	bool Emitter::SetMapFormat(EMITTER_MANIP value)
	{
		bool ok = false;
		if(m_pState->SetFlowType(GroupType::Map, value, FmtScope::Global))
			ok = true;
		if(m_pState->SetMapKeyFormat(value, FmtScope::Global))
			ok = true;
		return ok;
	}

	bool Emitter::SetIndent(unsigned n)
	{
		return m_pState->SetIndent(n, FmtScope::Global);
	}

	bool Emitter::SetPreCommentIndent(unsigned n)
	{
		return m_pState->SetPreCommentIndent(n, FmtScope::Global);
	}

	bool Emitter::SetPostCommentIndent(unsigned n)
	{
		return m_pState->SetPostCommentIndent(n, FmtScope::Global);
	}

	bool Emitter::SetLineWidth(unsigned n)
	{
		return m_pState->SetLineWidth(n, FmtScope::Global);
	}

	// SetLocalValue
	// . Either start/end a group, or set a modifier locally
	Emitter& Emitter::SetLocalValue(EMITTER_MANIP value)
	{
		if(!good())
			return *this;

		switch(value) {
			case BeginDoc:
				EmitBeginDoc();
				break;
			case EndDoc:
				EmitEndDoc();
				break;
			case BeginSeq:
				EmitBeginSeq();
				break;
			case EndSeq:
				EmitEndSeq();
				break;
			case BeginMap:
				EmitBeginMap();
				break;
			case EndMap:
				EmitEndMap();
				break;
			default:
				m_pState->SetLocalValue(value);
				break;
		}
		return *this;
	}

	Emitter& Emitter::SetLocalIndent(const _Indent& indent)
	{
		m_pState->SetIndent(indent.value, FmtScope::Local);
		return *this;
	}

	// EmitBeginDoc
	void Emitter::EmitBeginDoc()
	{
		if(!good())
			return;

		if(m_pState->CurGroupType() != GroupType::None || m_pState->HasAnchor() || m_pState->HasTag()) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_DOC);
			return;
		}

		if(m_stream.col() > 0)
			m_stream << "\n";
		m_stream << "---\n";

		m_directives = Directives();
		m_pState->StartedDoc();
	}

	// EmitEndDoc
	void Emitter::EmitEndDoc()
	{
		if(!good())
			return;

		if(m_pState->CurGroupType() != GroupType::None || m_pState->HasAnchor() || m_pState->HasTag()) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_DOC);
			return;
		}

		if(m_stream.col() > 0)
			m_stream << "\n";
		m_stream << "...\n";

		m_directives = Directives();
		m_pState->EndedDoc();
	}

	// EmitBeginSeq
	void Emitter::EmitBeginSeq()
	{
		if(!good())
			return;

		PrepareNode(m_pState->NextGroupType(GroupType::Seq));

		m_pState->StartedGroup(GroupType::Seq);
	}

	// EmitEndSeq
	void Emitter::EmitEndSeq()
	{
		if(!good())
			return;

		if(m_pState->CurGroupType() != GroupType::Seq)
			return m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_SEQ);

		if(m_pState->CurGroupChildCount() == 0)
			m_pState->ForceFlow();

		if(m_pState->CurGroupFlowType() == FlowType::Flow) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(m_pState->CurIndent());
			if(m_pState->CurGroupChildCount() == 0)
				m_stream << "[";
			m_stream << "]";
		}

		m_pState->EndedGroup(GroupType::Seq);
	}

	// EmitBeginMap
	void Emitter::EmitBeginMap()
	{
		if(!good())
			return;

		PrepareNode(m_pState->NextGroupType(GroupType::Map));

		m_pState->StartedGroup(GroupType::Map);
	}

	// EmitEndMap
	void Emitter::EmitEndMap()
	{
		if(!good())
			return;

		if(m_pState->CurGroupType() != GroupType::Map)
			return m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_MAP);

		if(m_pState->CurGroupChildCount() % 2 != 0)
			return m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_END_MAP);

		if(m_pState->CurGroupChildCount() == 0)
			m_pState->ForceFlow();

		if(m_pState->CurGroupFlowType() == FlowType::Flow) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(m_pState->CurIndent());
			if(m_pState->CurGroupChildCount() == 0)
				m_stream << "{";
			m_stream << "}";
		}

		m_pState->EndedGroup(GroupType::Map);
	}

	// Put the stream in a state so we can simply write the next node
	// E.g., if we're in a sequence, write the "- "
	void Emitter::PrepareNode(EmitterNodeType::value child)
	{
		switch(m_pState->CurGroupNodeType()) {
			case EmitterNodeType::NoType:
				PrepareTopNode(child);
				break;
			case EmitterNodeType::FlowSeq:
				FlowSeqPrepareNode(child);
				break;
			case EmitterNodeType::BlockSeq:
				BlockSeqPrepareNode(child);
				break;
			case EmitterNodeType::FlowMap:
				FlowMapPrepareNode(child);
				break;
			case EmitterNodeType::BlockMap:
				BlockMapPrepareNode(child);
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
				assert(false);
				break;
		}
	}

	void Emitter::PrepareTopNode(EmitterNodeType::value child)
	{
		if(child == EmitterNodeType::NoType)
			return;

		if(!m_pState->HasBegunNode() && m_pState->CurGroupChildCount() > 0) {
			// a second top node starts a new document
			if(m_stream.col() > 0)
				EmitBeginDoc();
			m_pState->ClearAnchors();
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent(), 0);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				if(m_pState->HasBegunNode())
					m_stream << "\n";
				break;
		}
	}

	void Emitter::FlowSeqPrepareNode(EmitterNodeType::value child)
	{
		const unsigned lastIndent = m_pState->LastIndent();

		if(!m_pState->HasBegunNode()) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(lastIndent);
			if(m_pState->CurGroupChildCount() == 0)
				m_stream << "[";
			else
				m_stream << ",";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent() || m_pState->CurGroupChildCount() > 0, lastIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				assert(false);
				break;
		}
	}

	void Emitter::BlockSeqPrepareNode(EmitterNodeType::value child)
	{
		const unsigned curIndent = m_pState->CurIndent();
		const unsigned nextIndent = curIndent + m_pState->CurGroupIndent();

		if(child == EmitterNodeType::NoType)
			return;

		if(!m_pState->HasBegunContent()) {
			if(m_pState->CurGroupChildCount() > 0 || m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(curIndent);
			m_stream << "-";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent(), nextIndent);
				break;
			case EmitterNodeType::BlockSeq:
				m_stream << "\n";
				break;
			case EmitterNodeType::BlockMap:
				if(m_pState->HasBegunContent() || m_stream.comment())
					m_stream << "\n";
				break;
		}
	}

	void Emitter::FlowMapPrepareNode(EmitterNodeType::value child)
	{
		if(m_pState->CurGroupChildCount() % 2 == 0) {
			if(m_pState->GetMapKeyFormat() == LongKey)
				m_pState->SetLongKey();
			if(child == EmitterNodeType::FlowSeq || child == EmitterNodeType::FlowMap)
				m_pState->SetLongKey();

			if(m_pState->CurGroupLongKey())
				FlowMapPrepareLongKey(child);
			else
				FlowMapPrepareSimpleKey(child);
		} else {
			if(m_pState->CurGroupLongKey())
				FlowMapPrepareLongKeyValue(child);
			else
				FlowMapPrepareSimpleKeyValue(child);
		}
	}

	void Emitter::FlowMapPrepareLongKey(EmitterNodeType::value child)
	{
		const unsigned lastIndent = m_pState->LastIndent();

		if(!m_pState->HasBegunNode()) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(lastIndent);
			if(m_pState->CurGroupChildCount() == 0)
				m_stream << "{ ?";
			else
				m_stream << ", ?";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent() || m_pState->CurGroupChildCount() > 0, lastIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				assert(false);
				break;
		}
	}

	void Emitter::FlowMapPrepareLongKeyValue(EmitterNodeType::value child)
	{
		const unsigned lastIndent = m_pState->LastIndent();

		if(!m_pState->HasBegunNode()) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(lastIndent);
			m_stream << ":";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent() || m_pState->CurGroupChildCount() > 0, lastIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				assert(false);
				break;
		}
	}

	void Emitter::FlowMapPrepareSimpleKey(EmitterNodeType::value child)
	{
		const unsigned lastIndent = m_pState->LastIndent();

		if(!m_pState->HasBegunNode()) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(lastIndent);
			if(m_pState->CurGroupChildCount() == 0)
				m_stream << "{";
			else
				m_stream << ",";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent() || m_pState->CurGroupChildCount() > 0, lastIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				assert(false);
				break;
		}
	}

	void Emitter::FlowMapPrepareSimpleKeyValue(EmitterNodeType::value child)
	{
		const unsigned lastIndent = m_pState->LastIndent();

		if(!m_pState->HasBegunNode()) {
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(lastIndent);
			m_stream << ":";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent() || m_pState->CurGroupChildCount() > 0, lastIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				assert(false);
				break;
		}
	}

	void Emitter::BlockMapPrepareNode(EmitterNodeType::value child)
	{
		if(m_pState->CurGroupChildCount() % 2 == 0) {
			if(m_pState->GetMapKeyFormat() == LongKey)
				m_pState->SetLongKey();
			if(child == EmitterNodeType::BlockSeq || child == EmitterNodeType::BlockMap || child == EmitterNodeType::FlowSeq || child == EmitterNodeType::FlowMap)
				m_pState->SetLongKey();

			if(m_pState->CurGroupLongKey())
				BlockMapPrepareLongKey(child);
			else
				BlockMapPrepareSimpleKey(child);
		} else {
			if(m_pState->CurGroupLongKey())
				BlockMapPrepareLongKeyValue(child);
			else
				BlockMapPrepareSimpleKeyValue(child);
		}
	}

	void Emitter::BlockMapPrepareLongKey(EmitterNodeType::value child)
	{
		const unsigned curIndent = m_pState->CurIndent();
		const std::size_t childCount = m_pState->CurGroupChildCount();

		if(child == EmitterNodeType::NoType)
			return;

		if(!m_pState->HasBegunContent()) {
			if(childCount > 0)
				m_stream << "\n";
			if(m_stream.comment())
				m_stream << "\n";
			m_stream << IndentTo(curIndent);
			m_stream << "?";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(true, curIndent + 1);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				if(m_pState->HasBegunContent())
					m_stream << "\n";
				break;
		}
	}

	void Emitter::BlockMapPrepareLongKeyValue(EmitterNodeType::value child)
	{
		const unsigned curIndent = m_pState->CurIndent();

		if(child == EmitterNodeType::NoType)
			return;

		if(!m_pState->HasBegunContent()) {
			m_stream << "\n";
			m_stream << IndentTo(curIndent);
			m_stream << ":";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(true, curIndent + 1);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				if(m_pState->HasBegunContent())
					m_stream << "\n";
				break;
		}
	}

	void Emitter::BlockMapPrepareSimpleKey(EmitterNodeType::value child)
	{
		const unsigned curIndent = m_pState->CurIndent();
		const std::size_t childCount = m_pState->CurGroupChildCount();

		if(child == EmitterNodeType::NoType)
			return;

		if(!m_pState->HasBegunNode()) {
			if(childCount > 0)
				m_stream << "\n";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(m_pState->HasBegunContent(), curIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				break;
		}
	}

	void Emitter::BlockMapPrepareSimpleKeyValue(EmitterNodeType::value child)
	{
		const unsigned curIndent = m_pState->CurIndent();
		const unsigned nextIndent = curIndent + m_pState->CurGroupIndent();

		if(!m_pState->HasBegunNode()) {
			m_stream << ":";
		}

		switch(child) {
			case EmitterNodeType::NoType:
				break;
			case EmitterNodeType::Property:
			case EmitterNodeType::Scalar:
			case EmitterNodeType::FlowSeq:
			case EmitterNodeType::FlowMap:
				SpaceOrIndentTo(true, nextIndent);
				break;
			case EmitterNodeType::BlockSeq:
			case EmitterNodeType::BlockMap:
				m_stream << "\n";
				break;
		}
	}

	// SpaceOrIndentTo
	// . Prepares for some more content by proper spacing
	// . An empty plain scalar needs no separator
	void Emitter::SpaceOrIndentTo(bool requireSpace, unsigned indent)
	{
		if(m_stream.comment())
			m_stream << "\n";
		if(m_emptyScalar)
			return;
		if(m_stream.col() > 0 && requireSpace)
			m_stream << " ";
		m_stream << IndentTo(indent);
	}

	// ContentIndent
	// . Where continuation lines of the current scalar go.
	unsigned Emitter::ContentIndent() const
	{
		if(m_pState->CurGroupType() == GroupType::None)
			return m_pState->GetIndent();
		return m_pState->CurIndent() + m_pState->CurGroupIndent();
	}

	// *******************************************************************************************
	// overloads of Write

	Emitter& Emitter::Write(const std::string& str)
	{
		if(!good())
			return *this;

		if(!Utils::IsValidUtf8(str)) {
			m_pState->SetError(EmitError::UnrepresentableScalar, ErrorMsg::INVALID_UTF8);
			return *this;
		}

		ScalarContext context;
		context.inFlow = m_pState->CurGroupFlowType() == FlowType::Flow;
		context.isKey = m_pState->CurGroupExpectsKey();
		context.allowEmptyPlain = m_pState->CurGroupFlowType() == FlowType::Block && !context.isKey;
		context.escapeNonAscii = m_pState->GetOutputCharset() == EscapeNonAscii;

		StringFormat::value strFormat = StringFormat::DoubleQuoted;
		if(!Utils::ComputeStringFormat(str, m_pState->GetStringFormat(), context, strFormat)) {
			m_pState->SetError(EmitError::UnrepresentableScalar, ErrorMsg::UNREPRESENTABLE_STYLE);
			return *this;
		}

		if(context.isKey && !m_pState->HasBegunNode() && Utils::WrittenLength(str, strFormat, context.escapeNonAscii) > MAX_SIMPLE_KEY_LENGTH)
			m_pState->SetMapKeyFormat(LongKey, FmtScope::Local);

		m_emptyScalar = strFormat == StringFormat::Plain && str.empty();
		PrepareNode(EmitterNodeType::Scalar);
		m_emptyScalar = false;

		const unsigned lineWidth = context.isKey ? 0 : m_pState->GetLineWidth();
		bool success = true;
		switch(strFormat) {
			case StringFormat::Plain:
				m_stream << str;
				break;
			case StringFormat::SingleQuoted:
				success = Utils::WriteSingleQuotedString(m_stream, str, lineWidth, ContentIndent());
				break;
			case StringFormat::DoubleQuoted:
				success = Utils::WriteDoubleQuotedString(m_stream, str, context.escapeNonAscii, lineWidth, ContentIndent());
				break;
			case StringFormat::Literal:
				success = Utils::WriteLiteralString(m_stream, str, ContentIndent());
				break;
			case StringFormat::Folded:
				success = Utils::WriteFoldedString(m_stream, str, lineWidth, ContentIndent());
				break;
		}

		if(!success) {
			m_pState->SetError(EmitError::UnrepresentableScalar, ErrorMsg::UNREPRESENTABLE_STYLE);
			return *this;
		}

		m_pState->StartedScalar();

		return *this;
	}

	Emitter& Emitter::Write(bool b)
	{
		if(!good())
			return *this;

		m_pState->SetStringFormat(Plain, FmtScope::Local);
		return Write(std::string(b ? "true" : "false"));
	}

	Emitter& Emitter::Write(const _Alias& alias)
	{
		if(!good())
			return *this;

		if(m_pState->HasAnchor() || m_pState->HasTag()) {
			m_pState->SetError(EmitError::InvalidAlias, ErrorMsg::INVALID_ALIAS);
			return *this;
		}

		const bool isKey = m_pState->CurGroupExpectsKey();
		PrepareNode(EmitterNodeType::Scalar);

		if(!m_pState->IsAnchorWritten(alias.content)) {
			m_pState->SetError(EmitError::InvalidAlias, ErrorMsg::ALIAS_NOT_WRITTEN + alias.content);
			return *this;
		}

		if(!Utils::WriteAlias(m_stream, alias.content)) {
			m_pState->SetError(EmitError::InvalidAlias, ErrorMsg::INVALID_ALIAS);
			return *this;
		}

		// "*a:" would read as an alias named "a:"
		if(isKey && !m_pState->CurGroupLongKey())
			m_stream << " ";

		m_pState->StartedScalar();

		return *this;
	}

	Emitter& Emitter::Write(const _Anchor& anchor)
	{
		if(!good())
			return *this;

		if(m_pState->HasAnchor()) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::INVALID_ANCHOR);
			return *this;
		}

		PrepareNode(EmitterNodeType::Property);

		if(!Utils::WriteAnchor(m_stream, anchor.content)) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::INVALID_ANCHOR);
			return *this;
		}

		m_pState->SetAnchor(anchor.content);

		return *this;
	}

	Emitter& Emitter::Write(const _Tag& tag)
	{
		if(!good())
			return *this;

		if(m_pState->HasTag()) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::INVALID_TAG);
			return *this;
		}

		PrepareNode(EmitterNodeType::Property);

		bool success = false;
		switch(tag.type) {
			case _Tag::Type::Verbatim:
				success = Utils::WriteTag(m_stream, tag.content, true);
				break;
			case _Tag::Type::PrimaryHandle:
				success = Utils::WriteTag(m_stream, tag.content, false);
				break;
			case _Tag::Type::NamedHandle:
				success = Utils::WriteTagWithPrefix(m_stream, tag.prefix, tag.content);
				break;
			case _Tag::Type::Resolved:
				success = WriteResolvedTag(tag.content);
				break;
		}

		if(!success) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::INVALID_TAG);
			return *this;
		}

		m_pState->SetTag();

		return *this;
	}

	// WriteResolvedTag
	// . Shortest form first: a declared handle (longest prefix), then "!!"
	//   and "!" unless a directive rebinds them, then the verbatim form.
	bool Emitter::WriteResolvedTag(const std::string& tag)
	{
		if(tag.empty())
			return false;

		typedef std::map<std::string, std::string>::const_iterator handle_iterator;
		handle_iterator best = m_directives.tags.end();
		for(handle_iterator it=m_directives.tags.begin();it!=m_directives.tags.end();++it) {
			const std::string& prefix = it->second;
			if(prefix.empty() || tag.compare(0, prefix.size(), prefix) != 0)
				continue;
			if(!Utils::IsValidTagSuffix(tag.substr(prefix.size())))
				continue;
			if(best == m_directives.tags.end() || prefix.size() > best->second.size())
				best = it;
		}

		if(best != m_directives.tags.end()) {
			const std::string& handle = best->first;
			const std::string suffix = tag.substr(best->second.size());
			if(handle == "!")
				return Utils::WriteTag(m_stream, suffix, false);
			return Utils::WriteTagWithPrefix(m_stream, handle.substr(1, handle.size() - 2), suffix);
		}

		const std::string corePrefix = CORE_TAG_PREFIX;
		if(m_directives.tags.find("!!") == m_directives.tags.end() && tag.compare(0, corePrefix.size(), corePrefix) == 0) {
			const std::string suffix = tag.substr(corePrefix.size());
			if(Utils::IsValidTagSuffix(suffix))
				return Utils::WriteTagWithPrefix(m_stream, "", suffix);
		}

		if(m_directives.tags.find("!") == m_directives.tags.end() && tag[0] == '!') {
			const std::string suffix = tag.substr(1);
			if(Utils::IsValidTagSuffix(suffix))
				return Utils::WriteTag(m_stream, suffix, false);
		}

		return Utils::WriteTag(m_stream, tag, true);
	}

	Emitter& Emitter::Write(const _Comment& comment)
	{
		if(!good())
			return *this;

		PrepareNode(EmitterNodeType::NoType);

		if(m_stream.col() > 0)
			m_stream << Indentation(m_pState->GetPreCommentIndent());
		Utils::WriteComment(m_stream, comment.content, m_pState->GetPostCommentIndent());

		m_pState->SetNonContent();

		return *this;
	}

	// Write (directives)
	// . Starts a document with its %YAML and %TAG lines; tags written in it
	//   are shortened with the declared handles.
	Emitter& Emitter::Write(const Directives& directives)
	{
		if(!good())
			return *this;

		if(m_pState->CurGroupType() != GroupType::None || m_pState->HasBegunNode()) {
			m_pState->SetError(EmitError::InvalidState, ErrorMsg::UNEXPECTED_DOC);
			return *this;
		}

		if(m_stream.col() > 0)
			m_stream << "\n";

		// directives can only follow the end of a document
		if(m_stream.pos() > 0 && !m_pState->DocEnded())
			m_stream << "...\n";

		if(!directives.version.isDefault)
			m_stream << fmt::format("%YAML {}.{}\n", directives.version.major, directives.version.minor);

		for(std::map<std::string, std::string>::const_iterator it=directives.tags.begin();it!=directives.tags.end();++it)
			m_stream << fmt::format("%TAG {} {}\n", it->first, it->second);

		m_stream << "---\n";

		m_directives = directives;
		m_pState->StartedDoc();

		return *this;
	}
}
