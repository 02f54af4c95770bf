// gzip_open.cpp

#include "gzio/gzip_open.hpp"

using namespace std;

namespace gzio {
    gzip_handle
    open(string const & path, string_view mode, open_options const & opts)
    {
        if (parse_mode(mode).text)
            return text_file::open(path, mode, opts);

        return binary_file::open(path, mode, opts);
    }

    gzip_handle
    open(std::streambuf & sbuf, string_view mode, open_options const & opts)
    {
        if (parse_mode(mode).text)
            return text_file::open(sbuf, mode, opts);

        return binary_file::open(sbuf, mode, opts);
    }
} /*namespace gzio*/

/* end gzip_open.cpp */
