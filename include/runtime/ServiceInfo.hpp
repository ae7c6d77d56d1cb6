#pragma once

namespace folio::runtime {

constexpr auto* SERVICE_NAME = "Folio PDF Service";
constexpr auto* SERVICE_VERSION = "1.0.0";
constexpr auto* SERVER_HEADER = "folio/1.0.0";

}
