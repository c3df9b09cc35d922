/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_JSON_HPP
#define ELECTIONGUARD_JSON_HPP

#include <nlohmann/json.hpp>

#endif
