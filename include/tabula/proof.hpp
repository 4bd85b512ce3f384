#pragma once

#include <tabula/proof/attestation_backend.hpp>
#include <tabula/proof/backend.hpp>
#include <tabula/proof/error.hpp>
#include <tabula/proof/verifier.hpp>
