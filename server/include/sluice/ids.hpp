#pragma once

#include <string>

namespace sluice {

// Time-ordered UUIDv7 (48-bit millis, 12-bit sequence, 62 random bits)
std::string generate_uuid();

// Human readable payload id: job_<unix millis>_<9 base36 chars>
std::string generate_job_id();

} // namespace sluice
