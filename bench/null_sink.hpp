#pragma once
#include "nslog/sink/sink_interface.hpp"

namespace nslog {

class NullSink : public ISink {
public:
    void write(const LogRecord&) override {}
};

} // namespace nslog
