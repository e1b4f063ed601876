#include "Ids.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace flowgraph::util {

std::string NewId() {
    // random_generator is not thread-safe; one per thread.
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace flowgraph::util
