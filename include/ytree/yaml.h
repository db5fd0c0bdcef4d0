#ifndef YAML_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define YAML_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/tokenizer.h"
#include "ytree/parser.h"
#include "ytree/loader.h"
#include "ytree/emitter.h"
#include "ytree/emitfromevents.h"
#include "ytree/dump.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"

#endif // YAML_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
