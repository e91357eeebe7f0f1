/*!
  \file influxdb_exporter.cpp
  \brief Точка входа influxdb_exporter.
  \details Принимает метрики в формате InfluxDB line protocol по HTTP и UDP
  и отдаёт их в формате Prometheus.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
  ServiceController controller;
  return controller.run(argc, argv);
}
