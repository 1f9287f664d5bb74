#ifndef BT_CXX_STD_HPP
#define BT_CXX_STD_HPP

/* standard library headers shared by every translation unit */
#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#endif // BT_CXX_STD_HPP
