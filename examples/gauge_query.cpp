#include <iostream>
#include <string>
#include "devices/gauge_client.hpp"
#include "transport/serial.hpp"
#include "common/helpers.hpp"

int main(int argc, char** argv)
{
    using namespace vgauge;

    std::string port = argc > 1 ? argv[1] : "/dev/ttyUSB0";
    int address = Protocol::DEFAULT_DEVICE_ID;
    if (argc > 2) {
        auto parsed = parse_unsigned(argv[2]);
        if (!parsed || *parsed > static_cast<unsigned long>(Protocol::MAX_DEVICE_ID)) {
            std::cerr << "Invalid address " << argv[2] << "\n";
            return 2;
        }
        address = static_cast<int>(*parsed);
    }

    std::cout << "=== Gauge query " << port << " #" << address << " ===" << std::endl;

    SerialPort serial;
    if (!serial.open(port).ok()) {
        std::cout << "[SKIP] " << port << " not available\n";
        return 1;
    }

    GaugeClient gauge(serial, address);
    if (argc > 3) {
        gauge.set_log_callback([](const std::string& msg) { std::cout << "  " << msg << "\n"; });
    }

    auto model = gauge.get_model();
    if (!model.ok()) {
        std::cout << "[FAIL] Type: " << error_name(model.error()) << "\n";
        return 1;
    }
    std::cout << "[OK] Type: " << model.value() << "\n";

    auto p = gauge.measure();
    if (p.ok()) {
        std::cout << "[OK] Pressure: " << p.value() << " mbar\n";
    } else {
        std::cout << "[FAIL] Pressure: " << error_name(p.error()) << "\n";
    }

    for (int slot = 1; slot <= Protocol::Gauge::SLOTS; slot++) {
        auto sp = gauge.get_setpoint(slot);
        auto cal = gauge.get_calibration(slot);
        std::cout << "     Setpoint " << slot << ": " << (sp.ok() ? std::to_string(sp.value()) : error_name(sp.error()))
                  << "  Calibration " << slot << ": " << (cal.ok() ? std::to_string(cal.value()) : error_name(cal.error()))
                  << "\n";
    }

    auto penning = gauge.get_penning_state();
    if (penning.ok()) {
        std::cout << "     Penning: " << (penning.value() ? "on" : "off") << "\n";
    }

    serial.close();
    std::cout << "\n=== Done ===" << std::endl;
    return 0;
}
