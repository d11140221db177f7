#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/core/sale_processor.hpp"
#include "internal/model/shift.hpp"
#include "internal/util/outcome.hpp"
#include "service_context.hpp"

namespace stockroom::service {

/*
  Till operations: sales, returns and the cash drawer shift.
*/
class SalesService {
 public:
  explicit SalesService(ServiceContext ctx);

  util::OutcomeOf<model::Sale>              ProcessSale(const core::SaleRequest& request);
  util::OutcomeOf<std::size_t>              DeleteSale(const std::string& sale_id);
  util::OutcomeOf<std::size_t>              ClearSales(const std::optional<std::vector<model::SaleStatus>>& statuses);
  util::OutcomeOf<std::size_t>              PruneSales(int days, const std::optional<std::vector<model::SaleStatus>>& statuses);
  util::OutcomeOf<std::vector<model::Sale>> ListSales();
  util::OutcomeOf<model::Sale>              GetSale(const std::string& sale_id);

  util::OutcomeOf<model::Shift>                OpenShift(model::Money start_float);
  util::OutcomeOf<model::Shift>                CloseShift(model::Money actual_cash, const std::string& notes);
  util::OutcomeOf<std::optional<model::Shift>> CurrentShift();
  util::OutcomeOf<std::vector<model::Shift>>   ListShifts();

 private:
  ServiceContext ctx_;
};

} // namespace stockroom::service
