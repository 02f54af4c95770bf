/** @file tostr.hpp **/

#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace gzio {
    /** @brief print each of @p args on @p s,  left to right
     *  @param s stream on which to print
     *  @param args values to print (as per @c operator<<)
     **/
    template <class Stream, typename... Tn>
    Stream &
    tos(Stream & s, Tn && ...args) {
        (s << ... << std::forward<Tn>(args));
        return s;
    }

    /**
     * @brief construct string from in-order printed value of arguments
     *
     * @code
     *   tostr("gzio: bad offset [", off, "]")
     * @endcode
     *
     * Used to build exception messages and debug output.
     **/
    template <typename... Tn>
    std::string
    tostr(Tn && ...args) {
        std::ostringstream ss;
        tos(ss, std::forward<Tn>(args)...);
        return ss.str();
    }
} /*namespace gzio*/
