#pragma once

#include <mutual/encode/error.hpp>
#include <mutual/encode/hex.hpp>
#include <mutual/encode/utf8.hpp>
