// Debug.h

#pragma once
#include <mutex>
#include <sstream>
#include <string>

#ifdef SWIPEFICIENCY_DEBUG
constexpr bool DEBUG_ENABLED = true;
#else
constexpr bool DEBUG_ENABLED = false;
#endif

inline std::ostringstream& dout() {
    static std::ostringstream stream;
    return stream;
}

inline std::mutex& dout_mutex() {
    static std::mutex m;
    return m;
}

// Space between elements, and new line. Parallel chains share the stream.
template<typename... Args>
inline void debug([[maybe_unused]] Args&&... args){
    if constexpr(DEBUG_ENABLED){
        std::lock_guard<std::mutex> lock(dout_mutex());
        auto& os = dout();
        const char* sep = "";
        ((os<<sep<<std::forward<Args>(args), sep=" "), ...);
        os<<'\n';
    }
}

inline std::string get_debug_output() {
    std::lock_guard<std::mutex> lock(dout_mutex());
    return dout().str();
}

inline void clear_debug_output() {
    std::lock_guard<std::mutex> lock(dout_mutex());
    dout().str("");
    dout().clear();
}
