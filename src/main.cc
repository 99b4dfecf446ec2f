#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>
#include <core/constant/path.h>
#include <core/transfer/simulated_transfer.h>
#include <core/transfer/transfer_service.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <cstdlib>
#include <iostream>
#include <ipc/feedback_notification_surface.h>
#include <ipc/ipc_backend_service.h>
#include <ipc/ipc_event_stream.h>
#include <ipc/ipc_service.h>
#include <memory>
#include <string>

using namespace shuttle;
using namespace shuttle::core;
namespace net = boost::asio;
namespace po = boost::program_options;

static void startSimulatedTransfers(TransferService& transfer_service, int count) {
    for (int i = 0; i < count; ++i) {
        SimulatedTransfer::Options options;
        options.direction = i % 2 == 0 ? TransferDirection::kSend : TransferDirection::kReceive;
        options.remote_device_name = "Device " + std::to_string(i + 1);
        options.item_count = static_cast<std::uint64_t>(i + 1);
        options.step_interval = std::chrono::milliseconds(100 + 50 * i);
        auto id = transfer_service.StartTransfer(std::make_unique<SimulatedTransfer>(options));
        if (id == kInvalidTransferId) {
            spdlog::error("Failed to start simulated transfer with {}", options.remote_device_name);
        }
    }
}

int main(int argc, char* argv[]) {
    Logger logger(
#ifdef SHUTTLE_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    InitConfig();

    po::options_description desc("shuttle options");
    desc.add_options()("help,h", "show this help")(
        "simulate,n",
        po::value<int>()->default_value(0),
        "start N simulated transfers alternating between send and receive");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        spdlog::error("Invalid command line: {}", e.what());
        std::cerr << desc << '\n';
        return EXIT_FAILURE;
    }
    if (vm.count("help")) {
        std::cerr << desc << '\n';
        return EXIT_SUCCESS;
    }
    int simulate_count = vm["simulate"].as<int>();

    net::io_context ioc;
    auto work_guard = net::make_work_guard(ioc);

    ipc::IpcEventStream event_stream;
    ipc::FeedbackNotificationSurface surface(event_stream);
    TransferService transfer_service(
        ioc,
        surface,
        [] { return settings.notification_sound; },
        settings.progress_throttle_interval);
    ipc::IpcService ipc_service(ioc, event_stream);
    ipc::IpcBackendService backend_service(ioc, event_stream, transfer_service);

    backend_service.SetExitAppCallback([&] {
        ipc_service.Stop();
        work_guard.reset();
    });
    // Without a frontend, let the running transfers complete before exiting
    ipc_service.SetInputClosedCallback([&] { backend_service.Shutdown(false); });

    spdlog::info("shuttle backend started");

    ipc_service.Start();
    backend_service.Start();
    startSimulatedTransfers(transfer_service, simulate_count);

    ioc.run();

    transfer_service.Join();
    // Events raised after the loop stopped still hold their coordinators
    ioc.restart();
    ioc.run();
    SaveConfig();
    return EXIT_SUCCESS;
}
