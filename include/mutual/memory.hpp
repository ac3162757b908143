#pragma once

#include <mutual/memory/memory.hpp>
