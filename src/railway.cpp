#include <railway/impl.hpp>
