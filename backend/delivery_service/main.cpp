#include "application/audio_fitter.hpp"
#include "application/bot_service.hpp"
#include "application/cancellation_registry.hpp"
#include "application/job_queue.hpp"
#include "application/job_runner.hpp"
#include "application/pending_choice_store.hpp"
#include "application/size_planner.hpp"
#include "application/status_channel.hpp"
#include "application/status_reporter.hpp"
#include "application/worker_pool.hpp"
#include "infrastructure/http_client.hpp"
#include "infrastructure/range_prober.hpp"
#include "infrastructure/telegram_client.hpp"
#include "infrastructure/ytdlp_resolver.hpp"
#include "interface/update_dispatcher.hpp"
#include "interface/update_poller.hpp"
#include "interface/webhook_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include <boost/asio.hpp>
#include <curl/curl.h>

namespace {

struct CurlGlobal {
  CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize CURL");
    }
  }
  ~CurlGlobal() { curl_global_cleanup(); }
};

} // namespace

int main() {
  try {
    auto& cfg = config::Config::getInstance();
    cfg.load();

    const auto& bot_cfg = cfg.getBot();
    const auto& delivery_cfg = cfg.getDelivery();
    const auto& worker_cfg = cfg.getWorkers();
    const auto& http_cfg = cfg.getHttpClient();
    const auto& webhook_cfg = cfg.getWebhook();

    std::filesystem::create_directories(delivery_cfg.output_folder);
    CurlGlobal curl_global;

    auto http = std::make_shared<delivery_service::HttpClient>(http_cfg);
    auto telegram = std::make_shared<delivery_service::TelegramClient>(
      delivery_service::TelegramClientOptions{
        .api_base_url = bot_cfg.api_base_url,
        .token = bot_cfg.token,
        .api_timeout = http_cfg.api_timeout,
        .upload_connect_timeout = http_cfg.upload_connect_timeout,
        .upload_timeout = http_cfg.upload_timeout
      },
      http
    );

    std::shared_ptr<delivery_service::MediaResolver> resolver =
      std::make_shared<delivery_service::YtDlpResolver>(cfg.getResolver());
    std::shared_ptr<delivery_service::SizeProber> prober =
      std::make_shared<delivery_service::RangeProber>(http, http_cfg.probe_timeout);

    auto planner = std::make_shared<delivery_service::SizePlanner>(prober);
    auto fitter = std::make_shared<delivery_service::AudioFitter>(
      delivery_cfg.max_send_bytes, delivery_cfg.audio_headroom_bytes, delivery_cfg.audio_bitrate_ladder);

    delivery_service::StatusReporter reporter(telegram, delivery_cfg.edit_interval);
    delivery_service::StatusChannel status;
    delivery_service::PendingChoiceStore pending(delivery_cfg.pending_ttl);
    delivery_service::CancellationRegistry cancellations;
    delivery_service::JobQueue queue;

    delivery_service::JobRunner runner(resolver, telegram, status, cancellations,
      delivery_service::JobRunnerOptions{
        .output_folder = delivery_cfg.output_folder,
        .max_send_bytes = delivery_cfg.max_send_bytes
      });

    delivery_service::BotService bot(resolver, planner, fitter, reporter, status, pending, cancellations, queue,
      delivery_service::BotServiceOptions{
        .max_send_bytes = delivery_cfg.max_send_bytes,
        .log_chat_id = bot_cfg.log_chat_id
      });

    delivery_service::StatusPump pump(status, reporter);
    delivery_service::WorkerPool workers(queue,
      [&runner](const delivery_service::DeliveryJob& job) { return runner.run(job); },
      worker_cfg.workers);
    common::ThreadPool handlers(static_cast<unsigned int>(worker_cfg.handler_threads));
    delivery_service::UpdateDispatcher dispatcher(bot, handlers);

    std::cout << "Delivery bot started: " << workers.size() << " workers, limit "
              << delivery_cfg.max_send_bytes << " bytes" << std::endl;

    boost::asio::io_context ioc{1};
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

    if (webhook_cfg.mode == config::InboundMode::Webhook) {
      auto endpoint = boost::asio::ip::tcp::endpoint{
        boost::asio::ip::make_address(webhook_cfg.host), webhook_cfg.port
      };
      auto handler = std::make_shared<delivery_service::WebhookHandler>(
        delivery_service::kWebhookPath, webhook_cfg.secret_token, dispatcher);
      common::HttpServer http_server{ioc, endpoint, handler};

      if (auto registered = telegram->setWebhook(webhook_cfg.public_url + delivery_service::kWebhookPath,
                                                 webhook_cfg.secret_token); !registered) {
        throw std::runtime_error(registered.error());
      }
      std::cout << "Webhook server listening on " << http_server.localEndpoint() << std::endl;

      signals.async_wait([&](const boost::system::error_code&, int) {
        http_server.stop();
        ioc.stop();
      });
      http_server.run();
      ioc.run();
    } else {
      if (auto removed = telegram->deleteWebhook(); !removed) {
        std::cerr << "[main] deleteWebhook: " << removed.error() << std::endl;
      }

      delivery_service::UpdatePoller poller(telegram, dispatcher, http_cfg.poll_timeout);
      std::jthread poll_thread([&poller](std::stop_token stop) { poller.run(stop); });

      signals.async_wait([&](const boost::system::error_code&, int) {
        poll_thread.request_stop();
      });
      ioc.run();
    }

    std::cout << "Shutting down" << std::endl;
    handlers.stop();
    workers.shutdown();
    status.close();
    pump.stop();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
