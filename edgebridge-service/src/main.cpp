#include "BridgeService.hpp"
#include <edgebridge/Logger.hpp>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <getopt.h>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

using namespace edgebridge;

namespace {

volatile sig_atomic_t g_stop_requested = 0;
volatile sig_atomic_t g_reload_requested = 0;

// 终止信号只置标志，由主循环停止服务
void term_handler(int) {
    g_stop_requested = 1;
}

void hup_handler(int) {
    g_reload_requested = 1;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -c, --config FILE    指定配置文件路径 (默认: /etc/edgebridge/edgebridge.conf)\n"
              << "  -d, --daemon         以守护进程模式运行\n"
              << "  -v, --verbose        详细输出 (DEBUG)\n"
              << "  -x, --exec CMD       执行一次本地命令后退出，CMD 格式 TYPE[:k=v;k=v]\n"
              << "  -h, --help           显示此帮助信息\n"
              << "  -V, --version        显示版本信息\n"
              << "\n"
              << "示例:\n"
              << "  " << program_name << " -c /etc/edgebridge/edgebridge.conf\n"
              << "  " << program_name << " -x RUN_DIAGNOSTIC:level=full\n"
              << std::endl;
}

void print_version() {
    std::cout << "Edge Bridge v1.0.0\n"
              << "Base station device bridge: adapter manager and frame protocol\n"
              << std::endl;
}

/**
 * @brief 解析 -x 参数
 * @return 命令类型无法识别时返回 false
 */
bool parse_exec_argument(const std::string& arg, protocol::CommandType& type, std::vector<uint8_t>& params) {
    const size_t colon = arg.find(':');
    const std::string name = arg.substr(0, colon);
    if (!CommandExecutor::map_command_type(name, type)) {
        return false;
    }

    std::map<std::string, std::string> pairs;
    if (colon != std::string::npos) {
        std::string rest = arg.substr(colon + 1);
        size_t start = 0;
        while (start <= rest.size()) {
            size_t end = rest.find(';', start);
            if (end == std::string::npos) end = rest.size();
            const std::string item = rest.substr(start, end - start);
            const size_t eq = item.find('=');
            if (eq != std::string::npos && eq > 0) {
                pairs[item.substr(0, eq)] = item.substr(eq + 1);
            }
            start = end + 1;
        }
    }
    params = CommandExecutor::build_command_params(pairs);
    return true;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "Failed to fork daemon process" << std::endl;
        return false;
    }
    if (pid > 0) {
        std::cout << "Daemon started with PID: " << pid << std::endl;
        _exit(0);
    }

    if (setsid() < 0) {
        std::cerr << "Failed to create new session" << std::endl;
        return false;
    }
    if (chdir("/") != 0) {
        return false;
    }

    int fd = open("/dev/null", O_RDWR);
    if (fd < 0) {
        return false;
    }
    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO) {
        close(fd);
    }
    return true;
}

int run_local_command(const std::string& config_file, const std::string& exec_arg, bool verbose) {
    protocol::CommandType type;
    std::vector<uint8_t> params;
    if (!parse_exec_argument(exec_arg, type, params)) {
        std::cerr << "Unknown command type in: " << exec_arg << std::endl;
        return 1;
    }

    BridgeService service;
    if (!service.initialize(config_file)) {
        std::cerr << "Failed to initialize service" << std::endl;
        return 1;
    }
    if (verbose) set_log_level(LOG_DEBUG);

    protocol::CommandResultPayload result;
    StatusCode status = service.execute_local_command(type, params, result);
    if (status != StatusCode::OK) {
        std::cerr << "Command " << protocol::to_string(type) << " failed: " << to_string(status) << std::endl;
        return 1;
    }

    std::cout << protocol::to_string(type) << ": " << (result.success ? "success" : "failure")
              << " (return code " << static_cast<int>(result.return_code) << ")\n";
    if (!result.output.empty()) {
        std::cout << result.output << "\n";
    }
    return result.success ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/edgebridge/edgebridge.conf";
    std::string exec_arg;
    bool daemon_mode = false;
    bool verbose = false;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"daemon",   no_argument,       0, 'd'},
        {"verbose",  no_argument,       0, 'v'},
        {"exec",     required_argument, 0, 'x'},
        {"help",     no_argument,       0, 'h'},
        {"version",  no_argument,       0, 'V'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "c:dvx:Vh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config_file = optarg;
                break;
            case 'd':
                daemon_mode = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'x':
                exec_arg = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'V':
                print_version();
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (access(config_file.c_str(), R_OK) != 0) {
        std::cerr << "Error: Cannot read config file: " << config_file << std::endl;
        std::cerr << "Please create a configuration file or specify a different path with -c option." << std::endl;
        return 1;
    }

    if (!exec_arg.empty()) {
        return run_local_command(config_file, exec_arg, verbose);
    }

    std::signal(SIGINT, term_handler);
    std::signal(SIGTERM, term_handler);
    std::signal(SIGHUP, hup_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // 守护进程需在启动任何线程之前 fork
    if (daemon_mode && !daemonize()) {
        return 1;
    }

    auto service = std::make_unique<BridgeService>();
    std::cout << "Initializing Edge Bridge..." << std::endl;
    if (!service->initialize(config_file)) {
        std::cerr << "Failed to initialize service" << std::endl;
        return 1;
    }
    // -v 覆盖配置文件中的日志级别
    if (verbose) set_log_level(LOG_DEBUG);

    if (!service->start()) {
        std::cerr << "Failed to start service" << std::endl;
        return 1;
    }
    std::cout << "Edge Bridge is running..." << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // 停止后的管理器不能重启，重新加载配置时重建服务实例
        if (g_reload_requested) {
            g_reload_requested = 0;
            log(LOG_INFO, "Reloading configuration...");
            if (!service->verify_config_reload()) {
                log(LOG_ERROR, "New configuration is invalid, keeping the current one");
                continue;
            }
            service->stop();
            service = std::make_unique<BridgeService>();
            if (service->initialize(config_file) && service->start()) {
                if (verbose) set_log_level(LOG_DEBUG);
                log(LOG_INFO, "Configuration reloaded successfully");
            } else {
                log(LOG_ERROR, "Failed to reload configuration");
                return 1;
            }
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    service->stop();
    std::cout << "Edge Bridge stopped." << std::endl;
    return 0;
}
