#include <syncoro/src.hpp>
