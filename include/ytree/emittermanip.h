#ifndef EMITTERMANIP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTERMANIP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include <string>

namespace YTree
{
	enum EMITTER_MANIP {
		// general manipulators
		Auto,

		// output character set
		EmitNonAscii,
		EscapeNonAscii,

		// string manipulators
		// Auto, // duplicate
		Plain,
		SingleQuoted,
		DoubleQuoted,
		Literal,
		Folded,

		// document manipulators
		BeginDoc,
		EndDoc,

		// sequence manipulators
		BeginSeq,
		EndSeq,
		Flow,
		Block,

		// map manipulators
		BeginMap,
		EndMap,
		// Flow, // duplicate
		// Block, // duplicate
		// Auto, // duplicate
		LongKey
	};

	struct _Indent {
		_Indent(int value_): value(value_) {}
		int value;
	};

	inline _Indent Indent(int value) {
		return _Indent(value);
	}

	struct _Alias {
		_Alias(const std::string& content_): content(content_) {}
		std::string content;
	};

	inline _Alias Alias(const std::string content) {
		return _Alias(content);
	}

	struct _Anchor {
		_Anchor(const std::string& content_): content(content_) {}
		std::string content;
	};

	inline _Anchor Anchor(const std::string content) {
		return _Anchor(content);
	}

	// _Tag
	// . 'Resolved' takes a full tag and lets the emitter pick the shortest
	//   way of writing it under the current directives.
	struct _Tag {
		struct Type { enum value { Verbatim, PrimaryHandle, NamedHandle, Resolved }; };

		explicit _Tag(const std::string& prefix_, const std::string& content_, Type::value type_)
			: prefix(prefix_), content(content_), type(type_) {}
		std::string prefix;
		std::string content;
		Type::value type;
	};

	inline _Tag VerbatimTag(const std::string content) {
		return _Tag("", content, _Tag::Type::Verbatim);
	}

	inline _Tag LocalTag(const std::string content) {
		return _Tag("", content, _Tag::Type::PrimaryHandle);
	}

	inline _Tag LocalTag(const std::string& prefix, const std::string content) {
		return _Tag(prefix, content, _Tag::Type::NamedHandle);
	}

	inline _Tag SecondaryTag(const std::string content) {
		return _Tag("", content, _Tag::Type::NamedHandle);
	}

	inline _Tag Tag(const std::string content) {
		return _Tag("", content, _Tag::Type::Resolved);
	}

	struct _Comment {
		_Comment(const std::string& content_): content(content_) {}
		std::string content;
	};

	inline _Comment Comment(const std::string content) {
		return _Comment(content);
	}
}

#endif // EMITTERMANIP_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
