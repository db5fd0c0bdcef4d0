#ifndef EMITTERDEF_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTERDEF_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

namespace YTree
{
	struct EmitterNodeType { enum value { NoType, Property, Scalar, FlowSeq, BlockSeq, FlowMap, BlockMap }; };
}

#endif // EMITTERDEF_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
