#pragma once

// Umbrella header for the key codec rules
#include "codec/cstring.hpp"
#include "codec/decode_status.hpp"
#include "codec/greedy.hpp"
#include "codec/key_codec.hpp"
#include "codec/prefix.hpp"
#include "codec/tuple.hpp"
