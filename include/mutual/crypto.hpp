#pragma once

#include <mutual/crypto/hash.hpp>
#include <mutual/crypto/public_key.hpp>
#include <mutual/crypto/secret_key.hpp>
