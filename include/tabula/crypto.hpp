#pragma once

#include <tabula/crypto/hash.hpp>
#include <tabula/crypto/public_key.hpp>
#include <tabula/crypto/secret_key.hpp>
