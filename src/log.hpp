#pragma once

#include <string>

// Colored stderr default logger, pattern "[level +elapsed] message".
// Unknown level names fall back to info.
void init_logging(const std::string& level);
