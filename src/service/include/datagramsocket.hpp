/**
 * @file datagramsocket.hpp
 * @brief Абстракция UDP-сокета для приёма датаграмм
 *
 * @details UdpListener работает только через IDatagramSocket, что позволяет
 * подменять сокет в тестах.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @class IDatagramSocket
 * @brief Интерфейс источника датаграмм
 */
class IDatagramSocket {
 public:
  virtual ~IDatagramSocket() = default;

  /**
   * @brief Принять одну датаграмму
   *
   * @param buf Буфер приёма
   * @param size Размер буфера; более длинная датаграмма усекается
   * @param timeout Максимальное время ожидания
   * @return Длина датаграммы или std::nullopt, если за timeout ничего не пришло
   * @throw std::system_error При ошибке чтения
   */
  virtual std::optional<size_t> receive(char* buf, size_t size,
                                        std::chrono::milliseconds timeout) = 0;

  /// Локальный порт (после привязки)
  virtual uint16_t localPort() const = 0;
};

/**
 * @class UdpSocket
 * @brief POSIX-реализация IDatagramSocket
 */
class UdpSocket : public IDatagramSocket {
 public:
  /**
   * @brief Создать сокет и привязать его к адресу
   * @param host Адрес или имя; пустая строка - все интерфейсы
   * @param port Порт; 0 - выбрать свободный
   * @throw std::runtime_error Если адрес не разрешается
   * @throw std::system_error Если ни один из адресов не удалось привязать
   */
  UdpSocket(const std::string& host, uint16_t port);
  ~UdpSocket() override;

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  std::optional<size_t> receive(char* buf, size_t size,
                                std::chrono::milliseconds timeout) override;

  uint16_t localPort() const override;

  int fd() const { return sockfd_; }

 private:
  int sockfd_ = -1;
};
