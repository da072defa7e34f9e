#include <common/ChipRegistry.hpp>
#include <common/ConfigurationInfo.hpp>
#include <common/FirmwareLoader.hpp>
#include <common/Util.hpp>

#include <flasher/FlashJob.hpp>
#include <flasher/FlasherCallback.hpp>
#include <flasher/FlasherError.hpp>
#include <flasher/IspFlasher.hpp>

#include <transport/SerialTransport.hpp>

#include <argparse/argparse.hpp>

#include <easylogging++.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

INITIALIZE_EASYLOGGINGPP

enum class RunMode
{
	None,
	Info,
	Flash,
	Verify,
	Erase,
	EepromErase,
	Reset
};

struct RunOptions {
	RunMode runMode{ RunMode::None };
	std::string deviceName;
	unsigned baudrate{ transport::SerialTransport::DEFAULT_BAUDRATE };
	std::string configPath;
	std::string logPath;
	bool verbose{ false };
	std::string firmwarePath;
	bool noVerify{ false };
	bool noReset{ false };
};

bool getRunOptions(int argc, const char* argv[], RunOptions& options) {
	argparse::ArgumentParser program("WchFlasher", "1.0", argparse::default_arguments::help);
	program.add_argument("-d", "--device").default_value(std::string{ "/dev/ttyUSB0" }).help("Serial port of the device in ISP mode");
	program.add_argument("-b", "--baudrate").scan<'u', unsigned>().default_value(transport::SerialTransport::DEFAULT_BAUDRATE).help("Serial port speed");
	program.add_argument("-c", "--config").default_value(std::string{}).help("YAML file with chip definitions and protocol settings");
	program.add_argument("-l", "--log").default_value(std::string{ "wchflasher.log" }).help("Log file");
	program.add_argument("-v", "--verbose").default_value(false).implicit_value(true).nargs(0).help("Debug logging to console");

	argparse::ArgumentParser info_command("info", "1.0", argparse::default_arguments::help);
	info_command.add_description("Print chip information");

	argparse::ArgumentParser flash_command("flash", "1.0", argparse::default_arguments::help);
	flash_command.add_description("Flash BIN or HEX to chip");
	flash_command.add_argument("-i", "--input").required().help("File to flash");
	flash_command.add_argument("--no-verify").default_value(false).implicit_value(true).nargs(0).help("Skip verification");
	flash_command.add_argument("--no-reset").default_value(false).implicit_value(true).nargs(0).help("Stay in bootloader after flashing");

	argparse::ArgumentParser verify_command("verify", "1.0", argparse::default_arguments::help);
	verify_command.add_description("Verify chip flash against BIN or HEX");
	verify_command.add_argument("-i", "--input").required().help("File to compare with");

	argparse::ArgumentParser erase_command("erase", "1.0", argparse::default_arguments::help);
	erase_command.add_description("Erase whole code flash");

	argparse::ArgumentParser eeprom_erase_command("eeprom-erase", "1.0", argparse::default_arguments::help);
	eeprom_erase_command.add_description("Erase data flash (EEPROM)");

	argparse::ArgumentParser reset_command("reset", "1.0", argparse::default_arguments::help);
	reset_command.add_description("Leave bootloader and start application");

	program.add_subparser(info_command);
	program.add_subparser(flash_command);
	program.add_subparser(verify_command);
	program.add_subparser(erase_command);
	program.add_subparser(eeprom_erase_command);
	program.add_subparser(reset_command);
	try {
		program.parse_args(argc, argv);
		if (program.is_subcommand_used(info_command)) {
			options.runMode = RunMode::Info;
		}
		else if (program.is_subcommand_used(flash_command)) {
			options.firmwarePath = flash_command.get("-i");
			options.noVerify = flash_command.get<bool>("--no-verify");
			options.noReset = flash_command.get<bool>("--no-reset");
			options.runMode = RunMode::Flash;
		}
		else if (program.is_subcommand_used(verify_command)) {
			options.firmwarePath = verify_command.get("-i");
			options.runMode = RunMode::Verify;
		}
		else if (program.is_subcommand_used(erase_command)) {
			options.runMode = RunMode::Erase;
		}
		else if (program.is_subcommand_used(eeprom_erase_command)) {
			options.runMode = RunMode::EepromErase;
		}
		else if (program.is_subcommand_used(reset_command)) {
			options.runMode = RunMode::Reset;
		}
		else {
			std::cout << program;
			return false;
		}
		options.deviceName = program.get("-d");
		options.baudrate = program.get<unsigned>("-b");
		options.configPath = program.get("-c");
		options.logPath = program.get("-l");
		options.verbose = program.get<bool>("-v");
		return true;
	}
	catch (const std::exception& err) {
		std::cerr << err.what() << std::endl;
		std::cerr << program;
	}
	return false;
}

class FlasherCallback final : public flasher::FlasherCallback {
public:
	FlasherCallback() = default;

	void OnProgress(std::chrono::milliseconds timePoint, size_t currentValue,
		size_t maxValue) override {
		(void)timePoint;
		if (maxValue != 0) {
			std::cout << "\r" << currentValue * 100 / maxValue << "%" << std::flush;
		}
	}

	void OnState(flasher::FlasherState state) override {
		std::cout << std::endl;
		using flasher::FlasherState;
		switch (state) {
		case FlasherState::Initial:
			std::cout << "Starting";
			break;
		case FlasherState::Identified:
			std::cout << "Chip identified";
			break;
		case FlasherState::ConfigRead:
			std::cout << "Config read";
			break;
		case FlasherState::Unprotect:
			std::cout << "Code flash unprotected";
			break;
		case FlasherState::Erased:
			std::cout << "Flash erased";
			break;
		case FlasherState::KeyReady:
			std::cout << "Key negotiated";
			break;
		case FlasherState::Programmed:
			std::cout << "Flash written";
			break;
		case FlasherState::Verified:
			std::cout << "Flash verified";
			break;
		case FlasherState::Reset:
			std::cout << "Chip reset";
			break;
		case FlasherState::Done:
			std::cout << "Done";
			break;
		case FlasherState::Error:
			std::cout << "Error";
			break;
		}
	}

	void OnError(const flasher::FlasherError& error) override {
		std::cout << std::endl << "Step " << flasher::toString(error.getState()) << " failed";
		if (error.getAddress()) {
			std::cout << " at 0x" << std::hex << std::setw(8) << std::setfill('0')
				<< *error.getAddress() << std::dec << std::setfill(' ');
		}
		std::cout << ": " << error.getMessage();
	}
};

bool runFlashJob(const std::shared_ptr<flasher::IspFlasher>& ispFlasher, std::vector<uint8_t>&& firmware)
{
	flasher::FlashJob job{ { ispFlasher, std::move(firmware) } };
	FlasherCallback callback;
	job.registerCallback(callback);
	job.start();
	while (job.getCurrentState() != flasher::FlasherState::Done
		&& job.getCurrentState() != flasher::FlasherState::Error) {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
	}
	job.join();
	job.unregisterCallback(callback);
	const bool success = job.getCurrentState() == flasher::FlasherState::Done;
	std::cout << std::endl
		<< (success ? "Flashing done" : "Flashing error: " + job.getLastError())
		<< std::endl;
	return success;
}

bool flash(const std::shared_ptr<flasher::IspFlasher>& ispFlasher, const RunOptions& options)
{
	auto firmware{ common::loadFirmware(options.firmwarePath) };
	if (!options.noVerify && !options.noReset) {
		return runFlashJob(ispFlasher, std::move(firmware));
	}
	FlasherCallback callback;
	ispFlasher->registerCallback(callback);
	try {
		ispFlasher->flash(firmware);
		if (!options.noVerify) {
			ispFlasher->verify(firmware);
		}
		if (!options.noReset) {
			ispFlasher->reset();
		}
	}
	catch (...) {
		ispFlasher->unregisterCallback(callback);
		throw;
	}
	ispFlasher->unregisterCallback(callback);
	std::cout << std::endl << "Flashing done" << std::endl;
	return true;
}

int run(const RunOptions& options)
{
	common::ConfigurationInfo configuration;
	if (!options.configPath.empty()) {
		std::ifstream input(options.configPath);
		if (!input) {
			throw std::runtime_error("Can't open configuration " + options.configPath);
		}
		configuration = common::loadConfiguration(input);
	}
	const common::ChipRegistry registry{ configuration.chips.empty()
		? common::getBuiltinChips()
		: std::move(configuration.chips) };

	auto serial{ std::make_shared<transport::SerialTransport>(options.deviceName, options.baudrate) };
	auto ispFlasher{ std::make_shared<flasher::IspFlasher>(serial, registry, configuration.settings) };

	switch (options.runMode) {
	case RunMode::Info:
		std::cout << ispFlasher->describe() << std::endl;
		break;
	case RunMode::Flash:
		return flash(ispFlasher, options) ? 0 : 1;
	case RunMode::Verify: {
		const auto firmware{ common::loadFirmware(options.firmwarePath) };
		ispFlasher->setupKey();
		ispFlasher->verify(firmware);
		std::cout << "Verify done" << std::endl;
		break;
	}
	case RunMode::Erase:
		if (ispFlasher->getSession().codeFlashProtected) {
			ispFlasher->unprotect();
		}
		ispFlasher->eraseAll();
		std::cout << "Erase done" << std::endl;
		break;
	case RunMode::EepromErase:
		ispFlasher->eraseEeprom();
		std::cout << "EEPROM erase done" << std::endl;
		break;
	case RunMode::Reset:
		ispFlasher->reset();
		break;
	case RunMode::None:
		break;
	}
	return 0;
}

int main(int argc, const char* argv[]) {
	RunOptions options;
	if (!getRunOptions(argc, argv, options)) {
		return 1;
	}
	common::initLogger(options.logPath, options.verbose);
	try {
		return run(options);
	}
	catch (const std::exception& ex) {
		LOG(ERROR) << ex.what();
		std::cout << ex.what() << std::endl;
	}
	return 1;
}
