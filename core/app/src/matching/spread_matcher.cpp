#include "arb/matching/spread_matcher.hpp"
#include "arb/matching/spread_math.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace arb {

namespace {

// Notional (USD) below which the remaining target counts as reached.
constexpr double kNotionalEpsilon = 1e-9;

// Slack on the "target reached" comparison, absorbing float accumulation
// over many levels.
constexpr double kTargetSlack = 1e-6;

MatchVariant resolveVariant(MatchingStrategy preferred, bool has1,
                            bool has2) {
  switch (preferred) {
    case MatchingStrategy::AutoDetect:
    case MatchingStrategy::DualDepth:
      if (has1 && has2) {
        return MatchVariant::DualDepth;
      }
      return (has1 || has2) ? MatchVariant::SingleDepth
                            : MatchVariant::BestPrices;

    case MatchingStrategy::SingleDepth:
      return (has1 || has2) ? MatchVariant::SingleDepth
                            : MatchVariant::BestPrices;

    case MatchingStrategy::BestPrices:
      return MatchVariant::BestPrices;
  }
  return MatchVariant::BestPrices;
}

bool isPreferenceHonored(MatchingStrategy preferred, MatchVariant variant) {
  switch (preferred) {
    case MatchingStrategy::AutoDetect:  return true;
    case MatchingStrategy::DualDepth:   return variant == MatchVariant::DualDepth;
    case MatchingStrategy::SingleDepth: return variant == MatchVariant::SingleDepth;
    case MatchingStrategy::BestPrices:  return variant == MatchVariant::BestPrices;
  }
  return true;
}

}  // namespace

SpreadMatcher::SpreadMatcher(const IMarketDataSource& source,
                             MatcherConfig config)
    : source_(source), config_(config) {
  if (config_.max_depth_levels == 0) {
    config_.max_depth_levels = 1;
  }
}

// -----------------------------------------------------------------------------
// matchPair(): validate, probe, select, (swap), run
// -----------------------------------------------------------------------------
MatchResult SpreadMatcher::matchPair(const MatchRequest& request) const {
  if (request.symbol1.empty() || request.symbol2.empty() ||
      request.symbol1 == request.symbol2 ||
      !std::isfinite(request.target_notional) ||
      request.target_notional < 0.0) {
    std::cerr << "[SpreadMatcher] WARNING: invalid request " << request.symbol1
              << "/" << request.symbol2
              << " target=" << request.target_notional << ". Rejecting.\n";
    return reject(RejectReason::InvalidRequest, MatchVariant::BestPrices);
  }

  const bool has1 = hasDepth(request.symbol1);
  const bool has2 = hasDepth(request.symbol2);

  const MatchingStrategy preferred =
      request.strategy == MatchingStrategy::AutoDetect ? config_.strategy
                                                       : request.strategy;
  const MatchVariant variant = resolveVariant(preferred, has1, has2);

  if (config_.debug && !isPreferenceHonored(preferred, variant)) {
    std::cout << "[SpreadMatcher] preferred " << toString(preferred)
              << " not supported by data (depth " << request.symbol1 << "="
              << has1 << ", " << request.symbol2 << "=" << has2
              << "), using " << toString(variant) << "\n";
  }

  if (variant == MatchVariant::SingleDepth && !has1) {
    // Depth only on instrument 2: run with the instruments swapped so the
    // book side is instrument 1, then restore the caller's leg order.
    MatchRequest swapped = request;
    std::swap(swapped.symbol1, swapped.symbol2);
    swapped.direction = domain::flip(request.direction);

    MatchResult result = run(swapped, variant);
    std::swap(result.leg1, result.leg2);
    return result;
  }

  return run(request, variant);
}

// -----------------------------------------------------------------------------
// run(): build the plan for the chosen variant, then dispatch
// -----------------------------------------------------------------------------
MatchResult SpreadMatcher::run(const MatchRequest& request,
                               MatchVariant variant) const {
  const Sides sides = makeSides(request);
  std::optional<Plan> plan;

  switch (variant) {
    case MatchVariant::DualDepth: {
      auto buy_book = loadBook(sides.buy_symbol, domain::BookSide::Ask);
      auto sell_book = loadBook(sides.sell_symbol, domain::BookSide::Bid);
      if (!buy_book || !sell_book) {
        return reject(RejectReason::InvalidPrice, variant);
      }
      plan = DualDepthPlan{std::move(*buy_book), std::move(*sell_book)};
      break;
    }

    case MatchVariant::SingleDepth: {
      const bool book_is_buy_side =
          sides.direction == domain::MatchDirection::LongS1;
      auto book = loadBook(sides.symbol1, book_is_buy_side
                                              ? domain::BookSide::Ask
                                              : domain::BookSide::Bid);
      const double counter_price =
          executablePrice(sides.symbol2, !book_is_buy_side);
      if (!book || counter_price <= 0.0) {
        if (config_.debug) {
          std::cout << "[SpreadMatcher] invalid price for " << sides.symbol2
                    << " (counter=" << counter_price << ")\n";
        }
        return reject(RejectReason::InvalidPrice, variant);
      }
      plan = SingleDepthPlan{std::move(*book), book_is_buy_side,
                             counter_price};
      break;
    }

    case MatchVariant::BestPrices: {
      const double buy_price = executablePrice(sides.buy_symbol, true);
      const double sell_price = executablePrice(sides.sell_symbol, false);
      if (buy_price <= 0.0 || sell_price <= 0.0) {
        if (config_.debug) {
          std::cout << "[SpreadMatcher] invalid price: " << sides.buy_symbol
                    << " buy=" << buy_price << ", " << sides.sell_symbol
                    << " sell=" << sell_price << "\n";
        }
        return reject(RejectReason::InvalidPrice, variant);
      }
      plan = FallbackPlan{buy_price, sell_price};
      break;
    }
  }

  if (sides.target_notional == 0.0) {
    MatchResult result;
    result.executable = true;
    result.variant = variant;
    result.leg1 = MatchLeg{sides.symbol1, 0.0};
    result.leg2 = MatchLeg{sides.symbol2, 0.0};
    result.reached_target = true;
    return result;
  }

  return std::visit(
      [this, &sides](const auto& p) { return runPlan(sides, p); }, *plan);
}

// -----------------------------------------------------------------------------
// runPlan(DualDepthPlan): twin cursors over the buy and sell books
// -----------------------------------------------------------------------------
// Each step sizes the buy side from the remaining target, then sizes the sell
// side to the same market value plus whatever imbalance earlier steps left
// behind (lot truncation). When the sell level cannot cover that, the sell
// side is clamped and the buy side recomputed from it. The running
// imbalance therefore never exceeds one lot's value of either leg.
// -----------------------------------------------------------------------------
MatchResult SpreadMatcher::runPlan(const Sides& sides,
                                   const DualDepthPlan& plan) const {
  const domain::Depth& buy_book = plan.buy_book;
  const domain::Depth& sell_book = plan.sell_book;

  MatchResult result;
  result.variant = MatchVariant::DualDepth;

  std::size_t i = 0;
  std::size_t j = 0;
  double buy_left = buy_book[0].size;
  double sell_left = sell_book[0].size;

  auto advance_buy = [&] {
    if (++i < buy_book.size()) {
      buy_left = buy_book[i].size;
    }
  };
  auto advance_sell = [&] {
    if (++j < sell_book.size()) {
      sell_left = sell_book[j].size;
    }
  };

  double buy_quantity = 0.0;
  double sell_quantity = 0.0;
  double buy_usd = 0.0;
  double sell_usd = 0.0;
  double weighted_spread = 0.0;
  bool any_pair_passed = false;

  while (i < buy_book.size() && j < sell_book.size()) {
    const double buy_price = buy_book[i].price;
    const double sell_price = sell_book[j].price;
    const double spread = calcSpreadPct(buy_price, sell_price);

    if (!isSpreadAcceptable(spread, sides.max_spread_pct)) {
      // Only a higher bid further down the sell book can improve the pair.
      const bool better_bid = j + 1 < sell_book.size() &&
                              sell_book[j + 1].price > sell_price;
      if (config_.debug) {
        std::cout << "[SpreadMatcher] dual: " << sides.buy_symbol << " @ "
                  << buy_price << " / " << sides.sell_symbol << " @ "
                  << sell_price << " spread=" << spread << "% > max "
                  << sides.max_spread_pct << "%, "
                  << (better_bid ? "trying next counter level" : "stopping")
                  << "\n";
      }
      if (!better_bid) {
        break;
      }
      advance_sell();
      continue;
    }
    any_pair_passed = true;

    const double available_buy = roundToLot(buy_left, sides.buy_lot);
    if (available_buy <= 0.0) {
      advance_buy();
      continue;
    }
    const double available_sell = roundToLot(sell_left, sides.sell_lot);
    if (available_sell <= 0.0) {
      advance_sell();
      continue;
    }

    const double remaining = sides.target_notional - buy_usd;
    if (remaining <= kNotionalEpsilon) {
      break;
    }

    const double imbalance = buy_usd - sell_usd;

    double buy_qty = roundToLot(std::min(available_buy, remaining / buy_price),
                                sides.buy_lot);
    double sell_qty = roundToLot(
        std::max(0.0, (buy_qty * buy_price + imbalance) / sell_price),
        sides.sell_lot);

    if (sell_qty > available_sell) {
      // Largest buy whose hedge still rounds down to available_sell. The
      // unhedged value stays below one sell lot, and a larger target never
      // buys less at this level than a smaller one.
      sell_qty = available_sell;
      const double ceiling =
          (available_sell + sides.sell_lot) * sell_price - imbalance;
      double max_buy =
          roundToLot(std::max(0.0, ceiling / buy_price), sides.buy_lot);
      if (max_buy > 0.0 && max_buy * buy_price >= ceiling) {
        max_buy = std::max(0.0, roundToLot(max_buy - sides.buy_lot,
                                           sides.buy_lot));
      }
      buy_qty = std::min(buy_qty, max_buy);
    }

    if (buy_qty <= 0.0 && sell_qty <= 0.0) {
      break;
    }

    result.details.push_back(
        MatchDetail{buy_price, sell_price, buy_qty, sell_qty, spread});

    buy_quantity += buy_qty;
    sell_quantity += sell_qty;
    buy_usd += buy_qty * buy_price;
    sell_usd += sell_qty * sell_price;
    weighted_spread += spread * buy_qty;

    buy_left -= buy_qty;
    sell_left -= sell_qty;

    if (roundToLot(buy_left, sides.buy_lot) <= 0.0) {
      advance_buy();
    }
    if (roundToLot(sell_left, sides.sell_lot) <= 0.0) {
      advance_sell();
    }

    if (buy_usd >= sides.target_notional - kTargetSlack) {
      break;
    }
  }

  if (buy_quantity <= 0.0 || sell_quantity <= 0.0) {
    if (config_.debug) {
      std::cout << "[SpreadMatcher] dual: nothing matched for "
                << sides.buy_symbol << "/" << sides.sell_symbol << "\n";
    }
    return reject(any_pair_passed ? RejectReason::BelowLotSize
                                  : RejectReason::SpreadBelowThreshold,
                  MatchVariant::DualDepth);
  }

  result.avg_spread_pct = weighted_spread / buy_quantity;
  result.reached_target = buy_usd >= sides.target_notional - kTargetSlack;
  result.remaining_notional = std::max(0.0, sides.target_notional - buy_usd);
  finalize(sides, buy_quantity, sell_quantity, buy_usd, sell_usd, result);
  return result;
}

// -----------------------------------------------------------------------------
// runPlan(SingleDepthPlan): walk symbol1's book against a fixed counter price
// -----------------------------------------------------------------------------
MatchResult SpreadMatcher::runPlan(const Sides& sides,
                                   const SingleDepthPlan& plan) const {
  const double book_lot = plan.book_is_buy_side ? sides.buy_lot
                                                : sides.sell_lot;
  const double counter_lot = plan.book_is_buy_side ? sides.sell_lot
                                                   : sides.buy_lot;

  auto spread_at = [&](double level_price) {
    return plan.book_is_buy_side
               ? calcSpreadPct(level_price, plan.counter_price)
               : calcSpreadPct(plan.counter_price, level_price);
  };

  MatchResult result;
  result.variant = MatchVariant::SingleDepth;

  // Liquidity the gate admits, independent of the target.
  for (const auto& level : plan.book) {
    if (!isSpreadAcceptable(spread_at(level.price), sides.max_spread_pct)) {
      break;
    }
    ++result.valid_levels;
    result.max_supported_notional +=
        roundToLot(level.size, book_lot) * level.price;
  }

  double book_quantity = 0.0;
  double book_usd = 0.0;
  double weighted_spread = 0.0;
  bool any_level_passed = false;

  for (const auto& level : plan.book) {
    const double spread = spread_at(level.price);
    if (!isSpreadAcceptable(spread, sides.max_spread_pct)) {
      if (config_.debug) {
        std::cout << "[SpreadMatcher] single: " << sides.symbol1 << " level @ "
                  << level.price << " vs " << sides.symbol2 << " @ "
                  << plan.counter_price << " spread=" << spread
                  << "% > max " << sides.max_spread_pct << "%, stopping\n";
      }
      break;
    }
    any_level_passed = true;

    const double remaining = sides.target_notional - book_usd;
    if (remaining <= kNotionalEpsilon) {
      break;
    }

    const double available = roundToLot(level.size, book_lot);
    const double consumable =
        roundToLot(std::min(available, remaining / level.price), book_lot);
    if (consumable <= 0.0) {
      continue;
    }

    const double level_usd = consumable * level.price;
    const double hedge_share = level_usd / plan.counter_price;

    if (plan.book_is_buy_side) {
      result.details.push_back(MatchDetail{level.price, plan.counter_price,
                                           consumable, hedge_share, spread});
    } else {
      result.details.push_back(MatchDetail{plan.counter_price, level.price,
                                           hedge_share, consumable, spread});
    }

    book_quantity += consumable;
    book_usd += level_usd;
    weighted_spread += spread * consumable;

    if (book_usd >= sides.target_notional - kTargetSlack) {
      break;
    }
  }

  if (book_quantity <= 0.0) {
    return reject(any_level_passed ? RejectReason::BelowLotSize
                                   : RejectReason::SpreadBelowThreshold,
                  MatchVariant::SingleDepth);
  }

  const double counter_quantity =
      roundToLot(book_usd / plan.counter_price, counter_lot);
  if (counter_quantity <= 0.0) {
    if (config_.debug) {
      std::cout << "[SpreadMatcher] single: hedge of " << book_usd
                << " rounds to zero lots of " << sides.symbol2 << "\n";
    }
    return reject(RejectReason::BelowLotSize, MatchVariant::SingleDepth);
  }

  const double counter_usd = counter_quantity * plan.counter_price;

  result.avg_spread_pct = weighted_spread / book_quantity;
  result.reached_target = book_usd >= sides.target_notional - kTargetSlack;
  result.remaining_notional = std::max(0.0, sides.target_notional - book_usd);

  if (plan.book_is_buy_side) {
    finalize(sides, book_quantity, counter_quantity, book_usd, counter_usd,
             result);
  } else {
    finalize(sides, counter_quantity, book_quantity, counter_usd, book_usd,
             result);
  }
  return result;
}

// -----------------------------------------------------------------------------
// runPlan(FallbackPlan): unlimited size at both best prices
// -----------------------------------------------------------------------------
MatchResult SpreadMatcher::runPlan(const Sides& sides,
                                   const FallbackPlan& plan) const {
  const double spread = calcSpreadPct(plan.buy_price, plan.sell_price);
  if (!isSpreadAcceptable(spread, sides.max_spread_pct)) {
    if (config_.debug) {
      std::cout << "[SpreadMatcher] best prices: " << sides.buy_symbol << " @ "
                << plan.buy_price << " / " << sides.sell_symbol << " @ "
                << plan.sell_price << " spread=" << spread << "% > max "
                << sides.max_spread_pct << "%\n";
    }
    return reject(RejectReason::SpreadBelowThreshold,
                  MatchVariant::BestPrices);
  }

  const double buy_qty =
      roundToLot(sides.target_notional / plan.buy_price, sides.buy_lot);
  const double sell_qty =
      roundToLot(sides.target_notional / plan.sell_price, sides.sell_lot);
  if (buy_qty <= 0.0 || sell_qty <= 0.0) {
    return reject(RejectReason::BelowLotSize, MatchVariant::BestPrices);
  }

  MatchResult result;
  result.variant = MatchVariant::BestPrices;
  result.details.push_back(
      MatchDetail{plan.buy_price, plan.sell_price, buy_qty, sell_qty, spread});
  result.avg_spread_pct = spread;
  result.reached_target = true;
  result.remaining_notional = 0.0;
  finalize(sides, buy_qty, sell_qty, buy_qty * plan.buy_price,
           sell_qty * plan.sell_price, result);
  return result;
}

// -----------------------------------------------------------------------------
// finalize(): legs in caller order, fee-adjusted notionals and averages
// -----------------------------------------------------------------------------
void SpreadMatcher::finalize(const Sides& sides, double buy_quantity,
                             double sell_quantity, double raw_buy_notional,
                             double raw_sell_notional,
                             MatchResult& result) const {
  result.buy_notional = raw_buy_notional + sides.fee_per_share * buy_quantity;
  result.sell_notional =
      raw_sell_notional - sides.fee_per_share * sell_quantity;
  result.avg_buy_price =
      buy_quantity > 0.0 ? result.buy_notional / buy_quantity : 0.0;
  result.avg_sell_price =
      sell_quantity > 0.0 ? result.sell_notional / sell_quantity : 0.0;

  MatchLeg buy_leg{sides.buy_symbol, buy_quantity};
  MatchLeg sell_leg{sides.sell_symbol, -sell_quantity};

  if (sides.direction == domain::MatchDirection::LongS1) {
    result.leg1 = std::move(buy_leg);
    result.leg2 = std::move(sell_leg);
  } else {
    result.leg1 = std::move(sell_leg);
    result.leg2 = std::move(buy_leg);
  }
  result.executable = true;

  if (config_.debug) {
    std::cout << "[SpreadMatcher] " << toString(result.variant) << " matched | "
              << result.leg1.symbol << ": " << result.leg1.quantity << " | "
              << result.leg2.symbol << ": " << result.leg2.quantity
              << " | spread=" << result.avg_spread_pct << "% reached="
              << (result.reached_target ? "yes" : "no")
              << " remaining=" << result.remaining_notional << "\n";
  }
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
SpreadMatcher::Sides SpreadMatcher::makeSides(
    const MatchRequest& request) const {
  Sides sides;
  sides.symbol1 = request.symbol1;
  sides.symbol2 = request.symbol2;
  sides.direction = request.direction;

  const bool long_s1 = request.direction == domain::MatchDirection::LongS1;
  sides.buy_symbol = long_s1 ? request.symbol1 : request.symbol2;
  sides.sell_symbol = long_s1 ? request.symbol2 : request.symbol1;
  sides.buy_lot = source_.lotSize(sides.buy_symbol);
  sides.sell_lot = source_.lotSize(sides.sell_symbol);
  sides.target_notional = request.target_notional;
  sides.max_spread_pct = request.max_spread_pct;
  sides.fee_per_share = request.fee_per_share >= 0.0 ? request.fee_per_share
                                                     : config_.fee_per_share;
  return sides;
}

std::optional<domain::Depth> SpreadMatcher::loadBook(
    const domain::Symbol& symbol, domain::BookSide side) const {
  std::optional<domain::Depth> raw = source_.depth(symbol, side);
  if (!raw) {
    return std::nullopt;
  }

  domain::Depth book;
  for (const auto& level : *raw) {
    if (book.size() >= config_.max_depth_levels) {
      break;
    }
    if (level.price > 0.0 && level.size > 0.0) {
      book.push_back(level);
    }
  }

  if (book.empty()) {
    return std::nullopt;
  }
  return book;
}

bool SpreadMatcher::hasDepth(const domain::Symbol& symbol) const {
  return loadBook(symbol, domain::BookSide::Bid).has_value() &&
         loadBook(symbol, domain::BookSide::Ask).has_value();
}

double SpreadMatcher::executablePrice(const domain::Symbol& symbol,
                                      bool buying) const {
  const double quote =
      buying ? source_.bestAsk(symbol) : source_.bestBid(symbol);
  if (quote > 0.0) {
    return quote;
  }
  return source_.lastPrice(symbol);
}

MatchResult SpreadMatcher::reject(RejectReason reason, MatchVariant variant) {
  MatchResult result;
  result.executable = false;
  result.reject_reason = reason;
  result.variant = variant;
  return result;
}

}  // namespace arb
