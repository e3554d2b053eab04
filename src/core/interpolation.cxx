#include "interpolation.hxx"

interpolation_factory_t::interpolation_factory_t(protocol_ptr protocol,
                                                 real_t tau) {
  set_protocol(protocol);
  set_tau(tau);
}

void interpolation_factory_t::set_protocol(protocol_ptr protocol) {
  check_not_null(protocol, "protocol");
  _protocol = protocol;
}

void interpolation_factory_t::set_tau(real_t tau) {
  check_positive(tau, "tau");
  _tau = tau;
}

gradient_ptr
interpolation_factory_t::build_gradient(switching_gradient_ptr gradient) const {
  check_not_null(gradient, "switching gradient");
  return std::make_shared<interpolated_gradient_t>(gradient, _protocol, _tau);
}

temperature_ptr interpolation_factory_t::build_temperature(
    temperature_ptr temperature) const {
  check_not_null(temperature, "temperature schedule");
  return std::make_shared<interpolated_temperature_t>(temperature, _protocol,
                                                      _tau);
}
