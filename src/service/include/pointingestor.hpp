/**
 * @file pointingestor.hpp
 * @brief Общий путь приёма данных для HTTP и UDP
 */

#pragma once

#include <string_view>

#include "../include/exportercontext.hpp"
#include "../include/samplestore.hpp"
#include "ifx/LineProtocol.hpp"

/**
 * @class PointIngestor
 * @brief Разбор полезной нагрузки, преобразование в Sample и запись в хранилище
 */
class PointIngestor {
 public:
  PointIngestor(ExporterContext& ctx, SampleStore& store);

  /**
   * @brief Принять буфер line protocol
   *
   * @param payload Одна или несколько строк
   * @param precision Единица временных меток
   * @return Количество переданных в хранилище Sample
   * @throw ifx::lineprotocol::ParseError Если буфер некорректен; в этом
   *        случае в хранилище ничего не передаётся
   */
  size_t ingest(std::string_view payload,
                ifx::lineprotocol::Precision precision =
                    ifx::lineprotocol::Precision::Nanoseconds);

 private:
  ExporterContext& ctx_;
  SampleStore& store_;
};
