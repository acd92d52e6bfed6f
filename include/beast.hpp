#pragma once

#include <boost/beast/core.hpp>

namespace beast = boost::beast;
