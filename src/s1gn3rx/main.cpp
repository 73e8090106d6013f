#include "commands/detect.hpp"
#include "commands/extract.hpp"
#include "commands/update.hpp"
#include "config.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// info -> verbose -> trace -> debug -> pedantic
redlog::level level_from_verbosity(int count) {
  if (count <= 0) {
    return redlog::level::info;
  }
  if (count == 1) {
    return redlog::level::verbose;
  }
  if (count == 2) {
    return redlog::level::trace;
  }
  if (count == 3) {
    return redlog::level::debug;
  }
  return redlog::level::pedantic;
}

void apply_verbosity(const s1gn3rx::s1gn3rx_config& config) {
  int count = verbosity_flag ? args::get(verbosity_flag) : config.verbose;
  redlog::set_level(level_from_verbosity(count));

  auto log = redlog::get_logger("s1gn3rx");
  log.dbg("configuration loaded", redlog::field("source", config.source_string()));
}
} // namespace cli

int cmd_extract(
    const s1gn3rx::s1gn3rx_config& config, args::Positional<std::string>& image_arg,
    args::ValueFlag<std::string>& json_flag, args::ValueFlag<std::string>& signer_flag
) {
  auto log = redlog::get_logger("s1gn3rx.extract");
  cli::apply_verbosity(config);

  if (!image_arg) {
    log.err("image required");
    std::cerr << "error: image path is required" << std::endl;
    return 1;
  }

  s1gn3rx::commands::extract_request request;
  request.image_file = args::get(image_arg);
  request.output_json = json_flag ? args::get(json_flag) : "";
  request.output_signer = signer_flag ? args::get(signer_flag) : "";
  return s1gn3rx::commands::extract_command(request);
}

int cmd_update(
    const s1gn3rx::s1gn3rx_config& config, args::Positional<std::string>& file_arg,
    args::ValueFlag<std::string>& section_flag, args::ValueFlag<std::string>& new_model_flag,
    args::ValueFlag<std::string>& old_model_flag, args::ValueFlag<std::string>& preferred_flag,
    args::Flag& auto_detect_flag, args::Flag& experimental_flag
) {
  auto log = redlog::get_logger("s1gn3rx.update");
  cli::apply_verbosity(config);

  if (!file_arg) {
    log.err("file required");
    std::cerr << "error: file path is required" << std::endl;
    return 1;
  }

  s1gn3rx::commands::update_file_request request;
  request.file = args::get(file_arg);
  request.signer_section = section_flag ? args::get(section_flag) : "";
  request.new_model = new_model_flag ? args::get(new_model_flag) : "";
  request.old_model = old_model_flag ? args::get(old_model_flag) : "";
  request.preferred_model = preferred_flag ? args::get(preferred_flag) : config.preferred_model;
  request.auto_detect_old_model = auto_detect_flag ? true : config.auto_detect_old_model;
  request.experimental_model_replace = experimental_flag ? true : config.experimental_model_replace;
  return s1gn3rx::commands::update_file_command(request);
}

int cmd_detect(
    const s1gn3rx::s1gn3rx_config& config, args::Positional<std::string>& file_arg,
    args::ValueFlag<std::string>& preferred_flag
) {
  auto log = redlog::get_logger("s1gn3rx.detect");
  cli::apply_verbosity(config);

  if (!file_arg) {
    log.err("file required");
    std::cerr << "error: file path is required" << std::endl;
    return 1;
  }

  s1gn3rx::commands::detect_request request;
  request.file = args::get(file_arg);
  request.preferred_model = preferred_flag ? args::get(preferred_flag) : config.preferred_model;
  return s1gn3rx::commands::detect_command(request);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("s1gn3rx - SignerVer02 firmware record tool");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // extract command
  args::Command extract_cmd(parser, "extract", "decode the SignerVer02 record of an image");
  args::Positional<std::string> extract_image_arg(extract_cmd, "image", "source image (misc.bin, boot.img, ...)");
  args::ValueFlag<std::string> extract_json_flag(extract_cmd, "path", "write decoded fields as json", {"output-json"});
  args::ValueFlag<std::string> extract_signer_flag(
      extract_cmd, "path", "write the raw 128-byte record", {"output-signer"}
  );

  // update-file command
  args::Command update_cmd(parser, "update-file", "replace the SignerVer02 record and device model of a file");
  args::Positional<std::string> update_file_arg(update_cmd, "file", "file to update in place (e.g. boot.img)");
  args::ValueFlag<std::string> update_section_flag(
      update_cmd, "path", "file holding the new 128-byte SignerVer02 record", {"signer-section"}
  );
  args::ValueFlag<std::string> update_new_model_flag(update_cmd, "model", "new device model", {"new-model"});
  args::ValueFlag<std::string> update_old_model_flag(update_cmd, "model", "old device model", {"old-model"});
  args::ValueFlag<std::string> update_preferred_flag(
      update_cmd, "model", "preferred old model for auto detection", {"preferred-model"}
  );
  args::Flag update_auto_detect_flag(
      update_cmd, "auto-detect", "detect the old model from the file", {"auto-detect-old-model"}
  );
  args::Flag update_experimental_flag(
      update_cmd, "experimental", "replace the model outside the SignerVer02 record", {"experimental-model-replace"}
  );

  // detect command
  args::Command detect_cmd(parser, "detect", "list device model candidates found in a file");
  args::Positional<std::string> detect_file_arg(detect_cmd, "file", "file to scan");
  args::ValueFlag<std::string> detect_preferred_flag(
      detect_cmd, "model", "model to rank first when present", {"preferred-model"}
  );

  try {
    parser.ParseCLI(argc, argv);

    auto config = s1gn3rx::s1gn3rx_config::discover();

    if (extract_cmd) {
      return cmd_extract(config, extract_image_arg, extract_json_flag, extract_signer_flag);
    } else if (update_cmd) {
      return cmd_update(
          config, update_file_arg, update_section_flag, update_new_model_flag, update_old_model_flag,
          update_preferred_flag, update_auto_detect_flag, update_experimental_flag
      );
    } else if (detect_cmd) {
      return cmd_detect(config, detect_file_arg, detect_preferred_flag);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
