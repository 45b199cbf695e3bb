#pragma once

/**
 @brief Sets up the default easylogging++ configuration.
 Loggers are created on first use. Only errors are reported unless verbose is set.
 */
void init_logging(bool verbose);
