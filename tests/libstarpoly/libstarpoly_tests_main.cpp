#include <catch_main.hpp>
