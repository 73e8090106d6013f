#pragma once

// record layout and structured results
#include "engine/result.hpp"
#include "engine/types.hpp"

// core operations
#include "engine/model_detector.hpp"
#include "engine/patch_engine.hpp"
#include "engine/record_codec.hpp"
#include "engine/record_locator.hpp"
#include "engine/string_replacer.hpp"

// update pipeline
#include "engine/image_update.hpp"

// utilities
#include "utils/file_utils.hpp"
#include "utils/hex_utils.hpp"
#include "utils/pretty_hexdump.hpp"
#include "utils/text_encoding.hpp"
