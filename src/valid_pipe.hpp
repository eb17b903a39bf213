// src/valid_pipe.hpp - Re-export the stream contract and validating operators
#pragma once

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/just.hpp"
#include "lib/stream/passthrough_subject.hpp"
#include "lib/stream/publisher.hpp"
#include "lib/stream/sequence.hpp"
#include "lib/stream/sink.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"
#include "src/compact_validate.hpp"
#include "src/config.hpp"
#include "src/operators.hpp"
#include "src/try_validate.hpp"
#include "src/validate.hpp"
#include "src/validated_publisher.hpp"
#include "src/validated_subject.hpp"
#include "src/validator.hpp"
