#include <edgebridge/Types.hpp>
#include <algorithm>
#include <cctype>
#include <map>

namespace edgebridge {

const char *to_string(StatusCode code) {
	switch (code) {
		case StatusCode::OK: return "ok";
		case StatusCode::Error: return "error";
		case StatusCode::Timeout: return "timeout";
		case StatusCode::BadConfig: return "bad config";
		case StatusCode::NotConnected: return "not connected";
		case StatusCode::AlreadyConnected: return "already connected";
		case StatusCode::NotInitialized: return "not initialized";
		case StatusCode::InvalidParam: return "invalid parameter";
		case StatusCode::NotSupported: return "not supported";
		case StatusCode::DuplicateName: return "duplicate name";
		case StatusCode::NotFound: return "not found";
		case StatusCode::Cancelled: return "cancelled";
		case StatusCode::Incomplete: return "incomplete frame";
	}
	return "unknown";
}

namespace {

// 监控服务使用的指标名称
const std::map<MetricType, std::string> &metric_names() {
	static const std::map<MetricType, std::string> names = {
		{MetricType::CpuUsage, "CPU_USAGE"},
		{MetricType::MemoryUsage, "MEMORY_USAGE"},
		{MetricType::Temperature, "TEMPERATURE"},
		{MetricType::Humidity, "HUMIDITY"},
		{MetricType::FanSpeed, "FAN_SPEED"},
		{MetricType::Voltage, "VOLTAGE"},
		{MetricType::Current, "CURRENT"},
		{MetricType::PowerConsumption, "POWER_CONSUMPTION"},

		{MetricType::SignalStrength, "SIGNAL_STRENGTH"},
		{MetricType::SignalQuality, "SIGNAL_QUALITY"},
		{MetricType::Interference, "INTERFERENCE"},
		{MetricType::Ber, "BER"},
		{MetricType::Vswr, "VSWR"},
		{MetricType::AntennaTilt, "ANTENNA_TILT"},

		{MetricType::DataThroughput, "DATA_THROUGHPUT"},
		{MetricType::Latency, "LATENCY"},
		{MetricType::PacketLoss, "PACKET_LOSS"},
		{MetricType::Jitter, "JITTER"},
		{MetricType::ConnectionCount, "CONNECTION_COUNT"},

		{MetricType::BatteryLevel, "BATTERY_LEVEL"},
		{MetricType::Uptime, "UPTIME"},
		{MetricType::ErrorCount, "ERROR_COUNT"},

		{MetricType::DlThroughputNr700, "DL_THROUGHPUT_NR700"},
		{MetricType::UlThroughputNr700, "UL_THROUGHPUT_NR700"},
		{MetricType::RsrpNr700, "RSRP_NR700"},
		{MetricType::SinrNr700, "SINR_NR700"},

		{MetricType::DlThroughputNr3500, "DL_THROUGHPUT_NR3500"},
		{MetricType::UlThroughputNr3500, "UL_THROUGHPUT_NR3500"},
		{MetricType::RsrpNr3500, "RSRP_NR3500"},
		{MetricType::SinrNr3500, "SINR_NR3500"},

		{MetricType::PdcpThroughput, "PDCP_THROUGHPUT"},
		{MetricType::RlcThroughput, "RLC_THROUGHPUT"},
		{MetricType::InitialBler, "INITIAL_BLER"},
		{MetricType::AvgMcs, "AVG_MCS"},
		{MetricType::RbPerSlot, "RB_PER_SLOT"},
		{MetricType::RankIndicator, "RANK_INDICATOR"},

		{MetricType::TxImbalance, "TX_IMBALANCE"},
		{MetricType::LatencyPing, "LATENCY_PING"},
		{MetricType::HandoverSuccessRate, "HANDOVER_SUCCESS_RATE"},
		{MetricType::InterferenceLevel, "INTERFERENCE_LEVEL"},

		{MetricType::CaDlThroughput, "CA_DL_THROUGHPUT"},
		{MetricType::CaUlThroughput, "CA_UL_THROUGHPUT"},

		{MetricType::UtilityVoltageL1, "UTILITY_VOLTAGE_L1"},
		{MetricType::UtilityVoltageL2, "UTILITY_VOLTAGE_L2"},
		{MetricType::UtilityVoltageL3, "UTILITY_VOLTAGE_L3"},
		{MetricType::PowerFactor, "POWER_FACTOR"},
		{MetricType::GeneratorFuelLevel, "GENERATOR_FUEL_LEVEL"},
		{MetricType::GeneratorRuntime, "GENERATOR_RUNTIME"},
		{MetricType::BatterySoc, "BATTERY_SOC"},
		{MetricType::BatteryDod, "BATTERY_DOD"},
		{MetricType::BatteryCellTempMin, "BATTERY_CELL_TEMP_MIN"},
		{MetricType::BatteryCellTempMax, "BATTERY_CELL_TEMP_MAX"},
		{MetricType::SolarPanelVoltage, "SOLAR_PANEL_VOLTAGE"},
		{MetricType::SolarChargeCurrent, "SOLAR_CHARGE_CURRENT"},
		{MetricType::SitePowerKwh, "SITE_POWER_KWH"},

		{MetricType::WindSpeed, "WIND_SPEED"},
		{MetricType::WindDirection, "WIND_DIRECTION"},
		{MetricType::Precipitation, "PRECIPITATION"},
		{MetricType::LightningDistance, "LIGHTNING_DISTANCE"},
		{MetricType::TiltAngle, "TILT_ANGLE"},
		{MetricType::VibrationLevel, "VIBRATION_LEVEL"},
		{MetricType::WaterLevel, "WATER_LEVEL"},
		{MetricType::Pm25Level, "PM25_LEVEL"},
		{MetricType::SmokeDetected, "SMOKE_DETECTED"},
		{MetricType::CoLevel, "CO_LEVEL"},
		{MetricType::DoorStatus, "DOOR_STATUS"},
		{MetricType::MotionDetected, "MOTION_DETECTED"},

		{MetricType::FiberRxPower, "FIBER_RX_POWER"},
		{MetricType::FiberTxPower, "FIBER_TX_POWER"},
		{MetricType::FiberBer, "FIBER_BER"},
		{MetricType::FiberOsnr, "FIBER_OSNR"},
		{MetricType::MwRsl, "MW_RSL"},
		{MetricType::MwSnr, "MW_SNR"},
		{MetricType::MwModulation, "MW_MODULATION"},
		{MetricType::EthUtilization, "ETH_UTILIZATION"},
		{MetricType::EthErrors, "ETH_ERRORS"},
		{MetricType::EthLatency, "ETH_LATENCY"},
		{MetricType::PtpOffset, "PTP_OFFSET"},
		{MetricType::GpsSatellites, "GPS_SATELLITES"},

		{MetricType::BeamWeightMag, "BEAM_WEIGHT_MAG"},
		{MetricType::BeamWeightPhase, "BEAM_WEIGHT_PHASE"},
		{MetricType::PrecodingRank, "PRECODING_RANK"},
		{MetricType::PimLevel, "PIM_LEVEL"},
		{MetricType::CoChannelInterference, "CO_CHANNEL_INTERFERENCE"},
		{MetricType::OccupiedBandwidth, "OCCUPIED_BANDWIDTH"},
		{MetricType::Aclr, "ACLR"},
		{MetricType::GtpThroughput, "GTP_THROUGHPUT"},
		{MetricType::PacketDelay, "PACKET_DELAY"},
		{MetricType::RrcSetupSuccess, "RRC_SETUP_SUCCESS"},
		{MetricType::PagingSuccess, "PAGING_SUCCESS"},

		{MetricType::SliceThroughput, "SLICE_THROUGHPUT"},
		{MetricType::SliceLatency, "SLICE_LATENCY"},
		{MetricType::SlicePacketLoss, "SLICE_PACKET_LOSS"},
		{MetricType::SlicePrbUtil, "SLICE_PRB_UTIL"},
		{MetricType::SliceSlaCompliance, "SLICE_SLA_COMPLIANCE"},
	};
	return names;
}

} // namespace

std::string metric_type_name(MetricType type) {
	const auto &names = metric_names();
	auto it = names.find(type);
	return it != names.end() ? it->second : std::string();
}

bool parse_metric_type(const std::string &text, MetricType &type) {
	if (text.empty()) {
		return false;
	}

	// 数字编码：十进制或 0x 前缀十六进制
	if (std::isdigit(static_cast<unsigned char>(text[0]))) {
		try {
			size_t pos = 0;
			unsigned long code = std::stoul(text, &pos, 0);
			if (pos != text.size() || code > 0xFF) {
				return false;
			}
			type = static_cast<MetricType>(code);
			return code == 0xFF || !metric_type_name(type).empty();
		} catch (const std::exception &) {
			return false;
		}
	}

	std::string upper = text;
	std::transform(upper.begin(), upper.end(), upper.begin(),
	               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	if (upper == "ALL") {
		type = MetricType::All;
		return true;
	}
	for (const auto &kv : metric_names()) {
		if (kv.second == upper) {
			type = kv.first;
			return true;
		}
	}
	return false;
}

} // namespace edgebridge
