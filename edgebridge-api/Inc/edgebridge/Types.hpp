#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace edgebridge {

/**
 * @brief 状态码
 *
 */
enum class StatusCode {
	OK,
	Error,
	Timeout,
	BadConfig,
	NotConnected,
	AlreadyConnected,
	NotInitialized,
	InvalidParam,
	NotSupported,
	DuplicateName,   // 注册表中已存在同名适配器
	NotFound,        // 注册表中不存在该名称
	Cancelled,       // Context 被取消或超过截止时间
	Incomplete       // 帧尚未接收完整
};

/**
 * @brief 状态码转可读字符串，用于日志与错误汇总
 */
const char *to_string(StatusCode code);

/**
 * @brief 指标类型，与设备协议中的 1 字节编码一致
 *
 */
enum class MetricType : uint8_t {
	// System metrics (0x01-0x0F)
	CpuUsage = 0x01,
	MemoryUsage = 0x02,
	Temperature = 0x03,
	Humidity = 0x04,
	FanSpeed = 0x05,
	Voltage = 0x06,
	Current = 0x07,
	PowerConsumption = 0x08,

	// RF metrics (0x10-0x1F)
	SignalStrength = 0x10,
	SignalQuality = 0x11,
	Interference = 0x12,
	Ber = 0x13,
	Vswr = 0x14,
	AntennaTilt = 0x15,

	// Performance metrics (0x20-0x2F)
	DataThroughput = 0x20,
	Latency = 0x21,
	PacketLoss = 0x22,
	Jitter = 0x23,
	ConnectionCount = 0x24,

	// Device metrics (0x30-0x3F)
	BatteryLevel = 0x30,
	Uptime = 0x31,
	ErrorCount = 0x32,

	// 5G NR700 (n28)
	DlThroughputNr700 = 0x40,
	UlThroughputNr700 = 0x41,
	RsrpNr700 = 0x42,
	SinrNr700 = 0x43,

	// 5G NR3500 (n78)
	DlThroughputNr3500 = 0x50,
	UlThroughputNr3500 = 0x51,
	RsrpNr3500 = 0x52,
	SinrNr3500 = 0x53,

	// 5G radio
	PdcpThroughput = 0x60,
	RlcThroughput = 0x61,
	InitialBler = 0x62,
	AvgMcs = 0x63,
	RbPerSlot = 0x64,
	RankIndicator = 0x65,

	// RF quality
	TxImbalance = 0x70,
	LatencyPing = 0x71,
	HandoverSuccessRate = 0x72,
	InterferenceLevel = 0x73,

	// Carrier aggregation
	CaDlThroughput = 0x78,
	CaUlThroughput = 0x79,

	// Power & energy (0x80-0x8F)
	UtilityVoltageL1 = 0x80,
	UtilityVoltageL2 = 0x81,
	UtilityVoltageL3 = 0x82,
	PowerFactor = 0x83,
	GeneratorFuelLevel = 0x84,
	GeneratorRuntime = 0x85,
	BatterySoc = 0x86,
	BatteryDod = 0x87,
	BatteryCellTempMin = 0x88,
	BatteryCellTempMax = 0x89,
	SolarPanelVoltage = 0x8A,
	SolarChargeCurrent = 0x8B,
	SitePowerKwh = 0x8C,

	// Environmental & safety (0x90-0x9F)
	WindSpeed = 0x90,
	WindDirection = 0x91,
	Precipitation = 0x92,
	LightningDistance = 0x93,
	TiltAngle = 0x94,
	VibrationLevel = 0x95,
	WaterLevel = 0x96,
	Pm25Level = 0x97,
	SmokeDetected = 0x98,
	CoLevel = 0x99,
	DoorStatus = 0x9A,
	MotionDetected = 0x9B,

	// Transport / backhaul (0xA0-0xAF)
	FiberRxPower = 0xA0,
	FiberTxPower = 0xA1,
	FiberBer = 0xA2,
	FiberOsnr = 0xA3,
	MwRsl = 0xA4,
	MwSnr = 0xA5,
	MwModulation = 0xA6,
	EthUtilization = 0xA7,
	EthErrors = 0xA8,
	EthLatency = 0xA9,
	PtpOffset = 0xAA,
	GpsSatellites = 0xAB,

	// Advanced radio (0xB0-0xBF)
	BeamWeightMag = 0xB0,
	BeamWeightPhase = 0xB1,
	PrecodingRank = 0xB2,
	PimLevel = 0xB3,
	CoChannelInterference = 0xB4,
	OccupiedBandwidth = 0xB5,
	Aclr = 0xB6,
	GtpThroughput = 0xB7,
	PacketDelay = 0xB8,
	RrcSetupSuccess = 0xB9,
	PagingSuccess = 0xBA,

	// Network slicing (0xC0-0xCF)
	SliceThroughput = 0xC0,
	SliceLatency = 0xC1,
	SlicePacketLoss = 0xC2,
	SlicePrbUtil = 0xC3,
	SliceSlaCompliance = 0xC4,

	All = 0xFF
};

/**
 * @brief 指标类型在监控服务中的名称，如 CPU_USAGE；未知类型返回空串
 */
std::string metric_type_name(MetricType type);

/**
 * @brief 由名称（不区分大小写）或数字编码（"0x03"、"3"）解析指标类型
 * @return 是否解析成功
 */
bool parse_metric_type(const std::string &text, MetricType &type);

/**
 * @brief 单个指标值，由适配器产生后不再修改
 */
struct Metric {
	MetricType type { MetricType::All };
	float value { 0.0f };

	bool operator==(const Metric &other) const {
		return type == other.type && value == other.value;
	}
};

/**
 * @brief 外部标识（OID/topic/寄存器/xpath）到指标类型的映射
 *
 * @param external_id 设备侧原始标识
 * @param scale, offset 取值变换 raw*scale+offset
 */
struct MetricMapping {
	std::string external_id;
	MetricType metric_type { MetricType::All };
	float scale { 1.0f };
	float offset { 0.0f };
	std::string description;

	float apply_transform(float raw) const { return raw * scale + offset; }
};

/**
 * @brief 适配器配置：实例名、键值选项（约定的 key 由具体适配器文档说明）和指标映射
 */
struct AdapterConfig {
	std::string name;
	std::map<std::string, std::string> options;
	std::vector<MetricMapping> mappings;
};

} // namespace edgebridge
