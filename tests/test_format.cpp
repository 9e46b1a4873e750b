/*
 * Unit tests for output formats
 * Text block, JSON document, monitoring plugin line
 */

#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include <sstream>
#include "cli/format.hpp"
#include "fake_transport.hpp"
#include "protocol/parse.hpp"

using namespace aranet;
using namespace aranet::cli;

static DiscoveredDevice make_device(bool with_reading) {
    DiscoveredDevice device;
    device.adapter = std::make_shared<fake::Adapter>("hci0");
    device.peripheral_id = "AA:BB:CC:DD:EE:01";
    device.manufacturer_data.version = {1, 3, 4};
    device.manufacturer_data.integrations = true;

    if (with_reading) {
        std::vector<uint8_t> raw = {0x20, 0x03, 0x90, 0x01, 0x92, 0x27, 0x2D, 0x50, 0x01, 0x2C, 0x01, 0x78, 0x00};
        device.current_reading = parse::parse_current_reading_detailed(raw);
    }
    return device;
}

// ============================================================================
// Test Suite: TextFormat
// ============================================================================

TEST(TextFormat, Reading) {
    std::ostringstream out;
    print_text(out, make_device(true));
    auto text = out.str();

    EXPECT_NE(text.find("Measurement Age: 120/300s"), std::string::npos) << text;
    EXPECT_NE(text.find("Battery: 80%"), std::string::npos) << text;
    EXPECT_NE(text.find("CO2: 800 PPM"), std::string::npos) << text;
    EXPECT_NE(text.find("CO2 Status: Green"), std::string::npos) << text;
    EXPECT_NE(text.find("Temperature: 68.0°F (20.0°C)"), std::string::npos) << text;
    EXPECT_NE(text.find("Rel. Humidity: 45%"), std::string::npos) << text;
    EXPECT_NE(text.find("Pressure: 1.000 atm (1013 hPa)"), std::string::npos) << text;
}

TEST(TextFormat, AbsentSensorsOmitted) {
    auto device = make_device(true);
    device.current_reading->co2_ppm.reset();
    device.current_reading->temperature_c.reset();

    std::ostringstream out;
    print_text(out, device);
    EXPECT_EQ(out.str().find("CO2: "), std::string::npos);
    EXPECT_EQ(out.str().find("Temperature"), std::string::npos);
    EXPECT_NE(out.str().find("Pressure"), std::string::npos);
}

TEST(TextFormat, NoReading) {
    std::ostringstream out;
    print_text(out, make_device(false));
    EXPECT_EQ(out.str(), "<no sample data included in advertisement>\n");
}

TEST(TextFormat, StreamStateRestored) {
    std::ostringstream out;
    print_reading(out, *make_device(true).current_reading);
    out << 1.5;
    EXPECT_NE(out.str().find("1.5"), std::string::npos);
    EXPECT_EQ(out.str().find("1.500000"), std::string::npos);
}

// ============================================================================
// Test Suite: JsonFormat
// ============================================================================

TEST(JsonFormat, Reading) {
    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, to_json(make_device(true), false)));

    EXPECT_EQ(doc["peripheral_id"].as<std::string>(), "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(doc["adapter"].as<std::string>(), "hci0");
    EXPECT_EQ(doc["manufacturer_data"]["version"].as<std::string>(), "v1.3.4");
    EXPECT_EQ(doc["manufacturer_data"]["calibration_state"].as<std::string>(), "not_active");
    EXPECT_TRUE(doc["manufacturer_data"]["integrations"].as<bool>());
    EXPECT_FALSE(doc["manufacturer_data"]["disconnected"].as<bool>());

    JsonObject reading = doc["current_reading"].as<JsonObject>();
    ASSERT_FALSE(reading.isNull());
    EXPECT_EQ(reading["co2_ppm"].as<int>(), 800);
    EXPECT_DOUBLE_EQ(reading["temperature_c"].as<double>(), 20.0);
    EXPECT_DOUBLE_EQ(reading["pressure_hpa"].as<double>(), 1013.0);
    EXPECT_DOUBLE_EQ(reading["humidity"].as<double>(), 0.45);
    EXPECT_DOUBLE_EQ(reading["battery"].as<double>(), 0.8);
    EXPECT_EQ(reading["status"].as<std::string>(), "green");
    EXPECT_EQ(reading["interval"].as<int>(), 300);
    EXPECT_EQ(reading["age"].as<int>(), 120);
}

TEST(JsonFormat, AbsentValuesAreNull) {
    auto device = make_device(true);
    device.current_reading->co2_ppm.reset();
    device.current_reading->pressure_hpa.reset();

    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, to_json(device, false)));
    EXPECT_TRUE(doc["current_reading"]["co2_ppm"].isNull());
    EXPECT_TRUE(doc["current_reading"]["pressure_hpa"].isNull());
    EXPECT_FALSE(doc["current_reading"]["temperature_c"].isNull());
}

TEST(JsonFormat, NoReadingIsNull) {
    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, to_json(make_device(false), false)));
    EXPECT_TRUE(doc["current_reading"].isNull());
    EXPECT_FALSE(doc["manufacturer_data"].isNull());
}

TEST(JsonFormat, CompactIsSingleLine) {
    auto compact = to_json(make_device(true), false);
    auto pretty = to_json(make_device(true), true);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
}

TEST(JsonFormat, Error) {
    EXPECT_EQ(error_json("no adapters"), R"({"status":"error","message":"no adapters"})");
}

// ============================================================================
// Test Suite: NagiosFormat
// ============================================================================

TEST(NagiosFormat, ReadingIsOk) {
    auto report = nagios_report(make_device(true));
    EXPECT_EQ(report.state, ServiceState::Ok);
    EXPECT_EQ(report.exit_code(), 0);
    EXPECT_EQ(report.line,
              "ARANET4 OK - Advertisement from AA:BB:CC:DD:EE:01, Firmware v1.3.4 (Measurement age 120/300s)"
              " | battery=80%;30;10;0;100 co2_status=1;2;3;1;3 humidity=45%;;;0;100"
              " co2_ppm=800ppm;;;0; temperature_f=68.0F;;;0; pressure_atm=0.9998atm;;;0;");
}

TEST(NagiosFormat, NoReadingIsWarning) {
    auto report = nagios_report(make_device(false));
    EXPECT_EQ(report.state, ServiceState::Warning);
    EXPECT_EQ(report.exit_code(), 1);
    EXPECT_EQ(report.line,
              "ARANET4 WARNING - Advertisement from AA:BB:CC:DD:EE:01, Firmware v1.3.4 (Measurement not included)");
}

TEST(NagiosFormat, ErrorIsCritical) {
    auto report = nagios_error("Unable to discover devices. No Bluetooth adapters present.");
    EXPECT_EQ(report.exit_code(), 2);
    EXPECT_EQ(report.line, "ARANET4 CRITICAL - Unable to discover devices. No Bluetooth adapters present.");
}

TEST(NagiosFormat, StateNames) {
    EXPECT_EQ(to_string(ServiceState::Unknown), "UNKNOWN");
    EXPECT_EQ(NagiosReport{}.exit_code(), 3);
}
