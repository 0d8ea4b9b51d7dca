#pragma once

#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>
#include <mailcast/detail/backoff.hpp>

#include <mailcast/codec/base64.hpp>

#include <mailcast/core/account.hpp>
#include <mailcast/core/message.hpp>

#include <mailcast/oauth2/token.hpp>
#include <mailcast/oauth2/token_source.hpp>
#include <mailcast/credentials/credential_store.hpp>

#include <mailcast/content/attachment_provider.hpp>
#include <mailcast/content/sender_names.hpp>

#include <mailcast/errors/error_kind.hpp>
#include <mailcast/errors/error_classifier.hpp>

#include <mailcast/transport/transport.hpp>
#include <mailcast/transport/provider_directory.hpp>
#include <mailcast/transport/smtp_transport.hpp>

// Campaign engine
#include <mailcast/dispatch/campaign_config.hpp>
#include <mailcast/dispatch/campaign_planner.hpp>
#include <mailcast/dispatch/progress.hpp>
#include <mailcast/dispatch/connection_manager.hpp>
#include <mailcast/dispatch/worker_pool.hpp>
#include <mailcast/dispatch/report.hpp>
#include <mailcast/dispatch/campaign_controller.hpp>

#include <mailcast/io/input_files.hpp>
