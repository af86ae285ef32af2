#ifndef NSLOG_HPP
#define NSLOG_HPP

#include "nslog/core/log_common.hpp"
#include "nslog/core/log_level.hpp"
#include "nslog/core/environment.hpp"
#include "nslog/core/exception_info.hpp"
#include "nslog/core/errors.hpp"
#include "nslog/core/value.hpp"
#include "nslog/core/sanitizer.hpp"
#include "nslog/core/namespace_filter.hpp"
#include "nslog/core/message_format.hpp"
#include "nslog/core/log_record.hpp"
#include "nslog/core/app_info.hpp"
#include "nslog/core/runtime_config.hpp"
#include "nslog/fs/file_system.hpp"
#include "nslog/config/transport_descriptor.hpp"
#include "nslog/config/transport_config.hpp"
#include "nslog/formatter/formatter_interface.hpp"
#include "nslog/formatter/json_formatter.hpp"
#include "nslog/formatter/pretty_formatter.hpp"
#include "nslog/transport/transport_interface.hpp"
#include "nslog/transport/stdout_transport.hpp"
#include "nslog/transport/file_transport.hpp"
#include "nslog/rotate/rotate.hpp"
#include "nslog/sink/sink_interface.hpp"
#include "nslog/sink/stream_sink.hpp"
#include "nslog/sink/multi_sink.hpp"
#include "nslog/sink/rolling_file_sink.hpp"
#include "nslog/transport_factory.hpp"
#include "nslog/sink_logger.hpp"
#include "nslog/logger.hpp"
#include "nslog/global.hpp"

#endif // NSLOG_HPP
