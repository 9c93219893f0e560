// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "envact/api/configuration.hpp"
#include "envact/core/context.hpp"
#include "envact/core/output.hpp"

#include "envact.hpp"

int
main(int argc, char** argv)
{
    envact::Context ctx{ {
        /* .enable_logging = */ true,
    } };
    envact::Console console{ ctx };
    envact::Configuration config{ ctx };

    return run_envact(config, argc, argv);
}
