#pragma once

namespace pcapfin {

// "1"/"true"/"TRUE" -> true, "0"/"false"/"FALSE" -> false, anything else -> defv
bool env_bool(const char* key, bool defv);

// PCAPFIN_DEBUG enables the verbose [pcapfin] lines
bool debug_logging();

} // namespace pcapfin
