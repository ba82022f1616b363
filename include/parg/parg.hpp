#ifndef PARG_PARG_HPP
#define PARG_PARG_HPP

#include "argument.hpp"
#include "error.hpp"
#include "registry.hpp"
#include "value.hpp"

#endif // PARG_PARG_HPP
