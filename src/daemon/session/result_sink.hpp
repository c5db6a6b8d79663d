#pragma once

#include "session/transcript.hpp"

// Receives finished transcripts, e.g. for clipboard copy or typing into the focused field.
class ResultSink {
public:
    virtual ~ResultSink() = default;
    virtual void deliver(const AssembledTranscript& transcript) = 0;
};
