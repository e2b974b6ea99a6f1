#pragma once

// Umbrella header for the cardkit library

#include "cardkit/asset_store.hpp"
#include "cardkit/card.hpp"
#include "cardkit/card_codec.hpp"
#include "cardkit/charx.hpp"
#include "cardkit/config.hpp"
#include "cardkit/crc32.hpp"
#include "cardkit/encoding.hpp"
#include "cardkit/path_utils.hpp"
#include "cardkit/platform.hpp"
#include "cardkit/png.hpp"
#include "cardkit/uri.hpp"
#include "cardkit/zip.hpp"

#ifndef CARDKIT_VERSION
#define CARDKIT_VERSION "0.1.0"
#endif
