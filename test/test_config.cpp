#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include "gtest/gtest.h"

#include "docfill/config.hpp"
#include "docfill/error.hpp"
#include "docfill/scratch.hpp"
#include "fixtures.hpp"

namespace fs = std::filesystem;

using docfill::Config;
using namespace docfill_test;

using namespace testing;

class ConfigTestFixture : public Test {};

TEST_F(ConfigTestFixture, defaults) {
  Config cfg;
  EXPECT_EQ(cfg.data, "datos.xlsx");
  EXPECT_EQ(cfg.output_dir, "salida");
  EXPECT_EQ(cfg.template_dir, "plantillas");
  EXPECT_EQ(cfg.filename_pattern, "{NOMBRE} - {SALIDA}.pdf");
  EXPECT_TRUE(cfg.walk.scan_masters);
  EXPECT_TRUE(cfg.walk.scan_headers_footers);
  EXPECT_EQ(cfg.required_columns, (std::vector<std::string>{"TEMPLATE"}));
  EXPECT_EQ(cfg.export_options.retries, 2);
  EXPECT_EQ(cfg.export_options.engine, docfill::EngineChoice::Auto);
  EXPECT_EQ(cfg.export_options.filter, "pdf");
  EXPECT_FALSE(cfg.strict);
  EXPECT_FALSE(cfg.dry_run);
}

TEST_F(ConfigTestFixture, soffice_from_environment) {
  ::setenv("SOFFICE_BIN", "/opt/lo/soffice", 1);
  EXPECT_EQ(docfill::defaultConfig().soffice_bin, "/opt/lo/soffice");
  ::unsetenv("SOFFICE_BIN");
  EXPECT_EQ(docfill::defaultConfig().soffice_bin, "soffice");
}

TEST_F(ConfigTestFixture, yaml_overrides) {
  Config cfg;
  docfill::loadConfigString("data: input.csv\n"
                            "sheet: 2\n"
                            "scan_masters: false\n"
                            "export_engine: LibreOffice\n"
                            "export_retries: 4\n"
                            "pdf_filter_opts: SelectPdfVersion=1\n"
                            "required_columns: [TEMPLATE, NOMBRE]\n"
                            "column_formatters:\n"
                            "  IMPORTE: euros\n"
                            "  FECHA: dmy\n"
                            "unknown_key: whatever\n",
                            &cfg);
  EXPECT_EQ(cfg.data, "input.csv");
  EXPECT_EQ(cfg.sheet, "2");
  EXPECT_FALSE(cfg.walk.scan_masters);
  EXPECT_TRUE(cfg.walk.scan_headers_footers);
  EXPECT_EQ(cfg.export_options.engine, docfill::EngineChoice::LibreOffice);
  EXPECT_EQ(cfg.export_options.retries, 4);
  EXPECT_EQ(cfg.export_options.filter_options, "SelectPdfVersion=1");
  EXPECT_EQ(cfg.required_columns.size(), 2U);
  EXPECT_EQ(cfg.column_formatters.at("IMPORTE"), "euros");
  EXPECT_EQ(cfg.column_formatters.at("FECHA"), "dmy");
  EXPECT_EQ(cfg.output_dir, "salida");
}

TEST_F(ConfigTestFixture, empty_document_keeps_defaults) {
  Config cfg;
  docfill::loadConfigString("", &cfg);
  EXPECT_EQ(cfg.data, "datos.xlsx");
}

TEST_F(ConfigTestFixture, invalid_values) {
  Config cfg;
  EXPECT_THROW(docfill::loadConfigString("export_engine: word\n", &cfg), docfill::ConfigurationError);
  EXPECT_THROW(docfill::loadConfigString("export_retries: many\n", &cfg), docfill::ConfigurationError);
  EXPECT_THROW(docfill::loadConfigString("export_retries: -1\n", &cfg), docfill::ConfigurationError);
  EXPECT_THROW(docfill::loadConfigString("scan_masters: [1, 2]\n", &cfg), docfill::ConfigurationError);
  EXPECT_THROW(docfill::loadConfigString("- just\n- a list\n", &cfg), docfill::ConfigurationError);
  EXPECT_THROW(docfill::loadConfigString("data: [unclosed\n", &cfg), docfill::ConfigurationError);
}

TEST_F(ConfigTestFixture, load_from_file) {
  docfill::ScratchDir scratch("docfill_config");
  std::string file = (fs::path(scratch.path()) / "docfill.yaml").string();
  writeTextFile(file, "output_dir: out\nstrict: true\n");
  Config cfg;
  docfill::loadConfigFile(file, &cfg);
  EXPECT_EQ(cfg.output_dir, "out");
  EXPECT_TRUE(cfg.strict);
  EXPECT_THROW(docfill::loadConfigFile((fs::path(scratch.path()) / "absent.yaml").string(), &cfg),
               docfill::ConfigurationError);
}
