#pragma once

// Umbrella header for the hashtok library

#include "hashtok/types.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/config.hpp"
#include "hashtok/blake3.hpp"
#include "hashtok/window_extractor.hpp"
#include "hashtok/gram_generator.hpp"
#include "hashtok/syllable_segmenter.hpp"
#include "hashtok/positional_bucketer.hpp"
#include "hashtok/word_segmenter.hpp"
#include "hashtok/hash_quantizer.hpp"
#include "hashtok/signal_processing.hpp"
#include "hashtok/tokenizers.hpp"
