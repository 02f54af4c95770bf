// error.cpp

#include "compression/error.hpp"
#include "compression/tostr.hpp"
#include <exception>

using namespace std;

namespace gzio {
    resource_error::resource_error(std::string operation,
                                   std::uint64_t offset,
                                   std::string const & detail)
        : error(tostr("gzio: ", operation, " failed at offset ", offset, ": ", detail)),
          operation_{std::move(operation)},
          offset_{offset}
    {}

    void
    rethrow_as_resource_error(std::string const & operation,
                              std::uint64_t offset)
    {
        try {
            throw;
        } catch (error &) {
            throw;
        } catch (std::exception & ex) {
            std::throw_with_nested(resource_error(operation, offset, ex.what()));
        }
    }
} /*namespace gzio*/

/* end error.cpp */
