#include "credit/narration/template_narrator.hpp"
#include "credit/domain/currency_format.hpp"

#include <sstream>

namespace credit {

namespace {

void describeOption(std::ostringstream& out,
                    const domain::CreditOption& option) {
  switch (option.kind) {
    case domain::OptionKind::ShortenedSettlement:
      out << "Option " << option.option_id << " - Faster settlement\n"
          << "Settle within " << option.settlement_days
          << " days (no upfront)\n"
          << "-> Full " << formatCurrency(option.approved_amount, 0)
          << " approved\n";
      break;
    case domain::OptionKind::UpfrontPayment:
      out << "Option " << option.option_id << " - Standard timeline\n"
          << "Pay " << formatCurrency(option.upfront_amount, 0)
          << " upfront\n"
          << "-> Remaining "
          << formatCurrency(option.approved_amount - option.upfront_amount, 0)
          << " in " << option.settlement_days << " days\n";
      break;
    case domain::OptionKind::PartialApproval:
      out << "Option " << option.option_id << " - Reduced amount\n"
          << "Approve " << formatCurrency(option.approved_amount, 0)
          << " with " << option.settlement_days << "-day settlement\n"
          << "-> Request more credit later\n";
      break;
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// composeMessage(): greeting, one block per option, reply instructions
// -----------------------------------------------------------------------------
domain::CustomerMessage TemplateNarrator::composeMessage(
    const DecisionContext& context) {
  const auto& booking = context.booking;

  std::ostringstream body;
  body << "Hi " << booking.company_name << ",\n\n"
       << "Your " << formatCurrency(booking.booking_amount, 0) << " booking";
  if (!booking.route.empty()) {
    body << " (" << booking.route << ")";
  }
  body << " is ready! However, it exceeds your available credit.\n\n"
       << "We can approve this with one of these options:\n\n";

  domain::CustomerMessage message;
  std::string reply_list;
  for (std::size_t i = 0; i < context.options.size(); ++i) {
    const auto& option = context.options[i];
    describeOption(body, option);
    body << "\n";

    message.call_to_action_labels.push_back("Select " + option.option_id);
    if (i > 0) {
      reply_list += (i + 1 == context.options.size()) ? " or " : ", ";
    }
    reply_list += option.option_id;
  }

  body << "Reply " << reply_list << " to proceed.\n"
       << "Need help? Choose 'Support' below.\n\n"
       << "- Credit Team";
  message.call_to_action_labels.push_back("Support");

  message.subject =
      "Credit Options for " + formatCurrency(booking.booking_amount, 0) +
      " Booking";
  message.body = body.str();
  return message;
}

CounterProposal TemplateNarrator::proposeCounter(
    const NegotiationContext& context) {
  CounterProposal proposal;
  proposal.response_text =
      "Thanks for the feedback on round " +
      std::to_string(context.round_number) +
      ". Let me see what fits within our risk limits.";
  return proposal;
}

}  // namespace credit
