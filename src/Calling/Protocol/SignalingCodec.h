/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Entropy Calling project.
 */

#pragma once

#include "../Core/ErrorCodes.h"
#include "../Signaling/SignalEvents.h"

#include <cstdint>
#include <vector>

namespace EntropyEngine::Calling {

/**
 * @brief Encodes a signaling frame as a Cap'n Proto Envelope
 * @param envelope Event or acknowledgement to encode
 * @return Flat byte frame, or SerializationFailed
 */
Result<std::vector<uint8_t>> encodeEnvelope(const SignalEnvelope& envelope);

/**
 * @brief Decodes a frame produced by encodeEnvelope
 *
 * Malformed, truncated or unknown frames yield DeserializationFailed; the
 * caller drops them.
 *
 * @param frame Bytes received from the transport
 * @return Decoded envelope or error
 */
Result<SignalEnvelope> decodeEnvelope(const std::vector<uint8_t>& frame);

} // namespace EntropyEngine::Calling
