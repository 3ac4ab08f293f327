#pragma once

#include "application/ports/IDecoder.hpp"

namespace strata::application::services::decode
{

inline constexpr const char* kUnsupportedLinkType = "unsupported link type";

// Always fails with kUnsupportedLinkType. Fallback of the link-type registry.
const ports::IDecoder& UnknownDecoder();

// Wraps everything it is given in a PayloadLayer, claims the application slot
// and ends the chain. Terminal fallback for modules that cannot classify
// their inner payload.
const ports::IDecoder& PayloadDecoder();

}  // namespace strata::application::services::decode
