#ifndef _libstarpoly_Exception_h_
#define _libstarpoly_Exception_h_

#include <stdexcept>

namespace StarPoly {

// Base for the library's own exceptions, all of them derived from std::runtime_error.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define STARPOLY_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
// Critical exceptions point to a programming or configuration error of the caller.
STARPOLY_DERIVE_EXCEPTION(CriticalException,  Exception);
STARPOLY_DERIVE_EXCEPTION(RuntimeError,       CriticalException);
STARPOLY_DERIVE_EXCEPTION(LogicError,         CriticalException);
STARPOLY_DERIVE_EXCEPTION(InvalidArgument,    LogicError);
STARPOLY_DERIVE_EXCEPTION(ConfigurationError, RuntimeError);
STARPOLY_DERIVE_EXCEPTION(IOError,            CriticalException);
STARPOLY_DERIVE_EXCEPTION(FileIOError,        IOError);
// The point count and density do not describe a self-intersecting star.
// Deterministic for the given input, retrying makes no sense.
STARPOLY_DERIVE_EXCEPTION(GeometryError,      Exception);
#undef STARPOLY_DERIVE_EXCEPTION

} // namespace StarPoly

#endif // _libstarpoly_Exception_h_
