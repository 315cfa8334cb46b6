// Header-only build of Boost.JSON, compiled once for the library.
#include <boost/json/src.hpp>
