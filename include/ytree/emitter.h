#ifndef EMITTER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/directives.h"
#include "ytree/emitterdef.h"
#include "ytree/emittermanip.h"
#include "ytree/exceptions.h"
#include "ytree/noncopyable.h"
#include "ytree/ostream_wrapper.h"
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <string>

namespace YTree
{
	class EmitterState;

	// Emitter
	// . Streaming writer: nodes and manipulators go in through operator <<,
	//   YAML text comes out. Errors are sticky; check good() when done.
	class YTREE_API Emitter: private noncopyable
	{
	public:
		Emitter();
		explicit Emitter(std::ostream& stream);
		~Emitter();

		// output
		const char *c_str() const;
		std::size_t size() const;

		// state checking
		bool good() const;
		const std::string GetLastError() const;
		EmitError::Kind GetLastErrorKind() const;

		// global setters
		bool SetOutputCharset(EMITTER_MANIP value);
		bool SetStringFormat(EMITTER_MANIP value);
		bool SetSeqFormat(EMITTER_MANIP value);
		bool SetMapFormat(EMITTER_MANIP value);
		bool SetIndent(unsigned n);
		bool SetPreCommentIndent(unsigned n);
		bool SetPostCommentIndent(unsigned n);
		bool SetLineWidth(unsigned n);

		// local setters
		Emitter& SetLocalValue(EMITTER_MANIP value);
		Emitter& SetLocalIndent(const _Indent& indent);

		// overloads of write
		Emitter& Write(const std::string& str);
		Emitter& Write(bool b);
		Emitter& Write(const _Alias& alias);
		Emitter& Write(const _Anchor& anchor);
		Emitter& Write(const _Tag& tag);
		Emitter& Write(const _Comment& comment);
		Emitter& Write(const Directives& directives);

		template <typename T>
		Emitter& WriteIntegralType(T value);

	private:
		void EmitBeginDoc();
		void EmitEndDoc();
		void EmitBeginSeq();
		void EmitEndSeq();
		void EmitBeginMap();
		void EmitEndMap();

		bool WriteResolvedTag(const std::string& tag);

		void PrepareNode(EmitterNodeType::value child);
		void PrepareTopNode(EmitterNodeType::value child);
		void FlowSeqPrepareNode(EmitterNodeType::value child);
		void BlockSeqPrepareNode(EmitterNodeType::value child);

		void FlowMapPrepareNode(EmitterNodeType::value child);
		void FlowMapPrepareLongKey(EmitterNodeType::value child);
		void FlowMapPrepareLongKeyValue(EmitterNodeType::value child);
		void FlowMapPrepareSimpleKey(EmitterNodeType::value child);
		void FlowMapPrepareSimpleKeyValue(EmitterNodeType::value child);

		void BlockMapPrepareNode(EmitterNodeType::value child);
		void BlockMapPrepareLongKey(EmitterNodeType::value child);
		void BlockMapPrepareLongKeyValue(EmitterNodeType::value child);
		void BlockMapPrepareSimpleKey(EmitterNodeType::value child);
		void BlockMapPrepareSimpleKeyValue(EmitterNodeType::value child);

		void SpaceOrIndentTo(bool requireSpace, unsigned indent);
		unsigned ContentIndent() const;

	private:
		ostream_wrapper m_stream;
		std::unique_ptr<EmitterState> m_pState;
		bool m_emptyScalar;
		Directives m_directives;
	};

	template <typename T>
	inline Emitter& Emitter::WriteIntegralType(T value)
	{
		if(!good())
			return *this;

		std::stringstream str;
		str << value;
		SetLocalValue(Plain);
		return Write(str.str());
	}

	// overloads of insertion
	inline Emitter& operator << (Emitter& emitter, const std::string& v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, bool v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, const _Alias& v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, const _Anchor& v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, const _Tag& v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, const _Comment& v) { return emitter.Write(v); }
	inline Emitter& operator << (Emitter& emitter, const Directives& v) { return emitter.Write(v); }

	inline Emitter& operator << (Emitter& emitter, const char *v) { return emitter.Write(std::string(v)); }

	inline Emitter& operator << (Emitter& emitter, int v) { return emitter.WriteIntegralType(v); }
	inline Emitter& operator << (Emitter& emitter, unsigned v) { return emitter.WriteIntegralType(v); }
	inline Emitter& operator << (Emitter& emitter, long v) { return emitter.WriteIntegralType(v); }
	inline Emitter& operator << (Emitter& emitter, unsigned long v) { return emitter.WriteIntegralType(v); }
	inline Emitter& operator << (Emitter& emitter, long long v) { return emitter.WriteIntegralType(v); }
	inline Emitter& operator << (Emitter& emitter, unsigned long long v) { return emitter.WriteIntegralType(v); }

	inline Emitter& operator << (Emitter& emitter, EMITTER_MANIP value) {
		return emitter.SetLocalValue(value);
	}

	inline Emitter& operator << (Emitter& emitter, _Indent indent) {
		return emitter.SetLocalIndent(indent);
	}
}

#endif // EMITTER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
